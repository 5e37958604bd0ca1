#pragma once

#include "config/Config.hpp"
#include "http/Transport.hpp"
#include "storage/model/Bucket.hpp"
#include "storage/model/File.hpp"
#include "storage/model/MimeType.hpp"
#include "storage/model/Options.hpp"
#include "storage/model/Payloads.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sbs::storage {

enum class UploadMode { Upload, Update };

/**
 * Typed client for the Supabase Storage REST API.
 *
 * Every call is one request/response round trip against
 * {projectUrl}/storage/v1/... and throws on the first failure (see errors.hpp).
 * The client is never mutated after construction; withHeader() returns a
 * new value. The transport is shared between copies.
 */
class StorageClient {
public:
    static constexpr auto STORAGE_V1 = "/storage/v1";
    static constexpr auto HEADER_API_KEY = "apikey";

    StorageClient(std::string projectUrl, std::string apiKey,
                  std::shared_ptr<const http::Transport> transport = defaultTransport());

    // Reads SUPABASE_URL and SUPABASE_API_KEY; throws ConfigError if either is unset.
    static StorageClient fromEnv(std::shared_ptr<const http::Transport> transport = defaultTransport());

    static StorageClient fromConfig(const config::StorageConfig& cfg,
                                    std::shared_ptr<const http::Transport> transport = defaultTransport());

    // Uses the storage section held by ConfigRegistry; throws ConfigError before ConfigRegistry::init().
    static StorageClient fromConfig(std::shared_ptr<const http::Transport> transport = defaultTransport());

    // Throws HeaderError if the pair is not a legal header.
    [[nodiscard]] StorageClient withHeader(const std::string& name, const std::string& value) const;

    [[nodiscard]] const std::string& projectUrl() const { return projectUrl_; }
    [[nodiscard]] const http::HeaderMap& headers() const { return headers_; }

    // #########################################################################
    // ############################### BUCKETS #################################
    // #########################################################################

    // Returns the bucket name. The id defaults to the name.
    std::string createBucket(const std::string& name,
                             const std::optional<std::string>& id = std::nullopt,
                             bool isPublic = false,
                             const std::optional<std::vector<model::MimeType>>& allowedMimeTypes = std::nullopt,
                             std::optional<uint64_t> fileSizeLimit = std::nullopt) const;

    void deleteBucket(const std::string& id) const;

    [[nodiscard]] model::Bucket getBucket(const std::string& id) const;

    [[nodiscard]] std::vector<model::Bucket> listBuckets() const;

    // Unset MIME types / size limit are not sent; the server keeps or clears them.
    std::string updateBucket(const std::string& id, bool isPublic,
                             const std::optional<std::vector<model::MimeType>>& allowedMimeTypes = std::nullopt,
                             std::optional<uint64_t> fileSizeLimit = std::nullopt) const;

    std::string emptyBucket(const std::string& id) const;

    // #########################################################################
    // ################################ FILES ##################################
    // #########################################################################

    model::ObjectResponse uploadFile(const std::string& bucketId, const std::vector<uint8_t>& data,
                                     const std::string& path,
                                     const std::optional<model::FileOptions>& options = std::nullopt) const;

    model::ObjectResponse updateFile(const std::string& bucketId, const std::vector<uint8_t>& data,
                                     const std::string& path,
                                     const std::optional<model::FileOptions>& options = std::nullopt) const;

    // Same request as updateFile.
    model::ObjectResponse replaceFile(const std::string& bucketId, const std::vector<uint8_t>& data,
                                      const std::string& path,
                                      const std::optional<model::FileOptions>& options = std::nullopt) const;

    // Uses the authenticated render endpoint when a transform is given.
    [[nodiscard]] std::vector<uint8_t> downloadFile(const std::string& bucketId, const std::string& path,
                                                    const std::optional<model::DownloadOptions>& options = std::nullopt) const;

    std::string deleteFile(const std::string& bucketId, const std::string& path) const;

    std::vector<model::FileObject> deleteFiles(const std::string& bucketId, const std::vector<std::string>& paths) const;

    // Lists from the bucket root when path is unset. Folders only carry a name.
    [[nodiscard]] std::vector<model::FileObject> listFiles(const std::string& bucketId,
                                                           const std::optional<std::string>& path = std::nullopt,
                                                           const std::optional<model::FileSearchOptions>& options = std::nullopt) const;

    // Returns the destination key, e.g. "bucket/dest.txt".
    std::string copyFile(const std::string& fromBucket, const std::optional<std::string>& toBucket,
                         const std::string& fromPath, const std::optional<std::string>& toPath,
                         bool copyMetadata) const;

    std::string moveFile(const std::string& fromBucket, const std::optional<std::string>& toBucket,
                         const std::string& fromPath, const std::string& toPath) const;

    // #########################################################################
    // ############################# SIGNED URLS ###############################
    // #########################################################################

    // Returns {projectUrl}/storage/v1{signedURL}.
    [[nodiscard]] std::string createSignedUrl(const std::string& bucketId, const std::string& path,
                                              uint64_t expiresIn,
                                              const std::optional<model::TransformOptions>& transform = std::nullopt) const;

    [[nodiscard]] std::vector<model::SignedUrl> createMultipleSignedUrls(const std::string& bucketId,
                                                                         const std::vector<std::string>& paths,
                                                                         uint64_t expiresIn) const;

    [[nodiscard]] model::SignedUploadUrl createSignedUploadUrl(const std::string& bucketId, const std::string& path,
                                                               bool upsert = false) const;

    model::ObjectResponse uploadToSignedUrl(const std::string& bucketId, const std::string& token,
                                            const std::vector<uint8_t>& data, const std::string& path,
                                            const std::optional<model::FileOptions>& options = std::nullopt) const;

    // #########################################################################
    // ############################## PUBLIC URL ###############################
    // #########################################################################

    // Local URL construction only; no request is made.
    [[nodiscard]] std::string getPublicUrl(const std::string& bucketId, const std::string& path,
                                           const std::optional<model::DownloadOptions>& options = std::nullopt) const;

private:
    std::shared_ptr<const http::Transport> transport_;
    std::string projectUrl_;
    std::string apiKey_;
    http::HeaderMap headers_;

    static std::shared_ptr<const http::Transport> defaultTransport();

    [[nodiscard]] std::string storageUrl(std::string_view resource) const;
    [[nodiscard]] std::string absoluteUrl(std::string_view relative) const;
    [[nodiscard]] static std::string objectKey(std::string_view bucketId, std::string_view path);

    [[nodiscard]] http::HeaderMap authHeaders() const;
    static void applyFileOptions(http::HeaderMap& hdrs, const std::optional<model::FileOptions>& options);

    http::Response send(http::Method method, std::string url, const http::HeaderMap& callHeaders,
                        std::string body = {}) const;

    model::ObjectResponse uploadOrUpdate(UploadMode mode, const std::string& bucketId,
                                         const std::vector<uint8_t>& data, const std::string& path,
                                         const std::optional<model::FileOptions>& options) const;
};

}
