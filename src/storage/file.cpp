#include "storage/StorageClient.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/response.hpp"
#include "util/u8.hpp"
#include "util/url.hpp"

using namespace sbs::storage;
using namespace sbs::storage::model;
using namespace sbs::logging;
using namespace sbs::util;

model::ObjectResponse StorageClient::uploadOrUpdate(const UploadMode mode, const std::string& bucketId,
                                                    const std::vector<uint8_t>& data, const std::string& path,
                                                    const std::optional<FileOptions>& options) const {
    auto hdrs = authHeaders();
    applyFileOptions(hdrs, options);

    const auto method = mode == UploadMode::Upload ? http::Method::POST : http::Method::PUT;
    const std::string op = mode == UploadMode::Upload ? "uploadFile" : "updateFile";

    LogRegistry::storage()->debug("[StorageClient] {} {} bytes to {}/{}", op, data.size(), bucketId, path);

    const auto resp = send(method, storageUrl("object/" + objectKey(bucketId, path)), hdrs,
                           std::string(data.begin(), data.end()));
    return parseResponse<ObjectResponse>(resp, op);
}

model::ObjectResponse StorageClient::uploadFile(const std::string& bucketId, const std::vector<uint8_t>& data,
                                                const std::string& path,
                                                const std::optional<FileOptions>& options) const {
    return uploadOrUpdate(UploadMode::Upload, bucketId, data, path, options);
}

model::ObjectResponse StorageClient::updateFile(const std::string& bucketId, const std::vector<uint8_t>& data,
                                                const std::string& path,
                                                const std::optional<FileOptions>& options) const {
    return uploadOrUpdate(UploadMode::Update, bucketId, data, path, options);
}

model::ObjectResponse StorageClient::replaceFile(const std::string& bucketId, const std::vector<uint8_t>& data,
                                                 const std::string& path,
                                                 const std::optional<FileOptions>& options) const {
    return uploadOrUpdate(UploadMode::Update, bucketId, data, path, options);
}

std::vector<uint8_t> StorageClient::downloadFile(const std::string& bucketId, const std::string& path,
                                                 const std::optional<DownloadOptions>& options) const {
    const bool render = options && options->transform;

    std::string url;
    if (render) url = appendQuery(storageUrl("render/image/authenticated/" + objectKey(bucketId, path)),
                                  to_query(*options->transform));
    else url = storageUrl("object/" + objectKey(bucketId, path));

    const auto resp = send(http::Method::GET, std::move(url), authHeaders());

    if (!resp.ok()) {
        // binary error bodies still have to be readable in the message
        const auto message = toLossyUtf8(resp.body);
        LogRegistry::storage()->error("[StorageClient] downloadFile failed: HTTP={} Response:\n{}", resp.status, message);
        throw StorageError(resp.status, message);
    }

    return {resp.body.begin(), resp.body.end()};
}

std::string StorageClient::deleteFile(const std::string& bucketId, const std::string& path) const {
    const auto resp = send(http::Method::DELETE, storageUrl("object/" + objectKey(bucketId, path)), authHeaders());
    return parseResponse<MessageResponse>(resp, "deleteFile").message;
}

std::vector<FileObject> StorageClient::deleteFiles(const std::string& bucketId,
                                                   const std::vector<std::string>& paths) const {
    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const DeleteFilesPayload payload{.prefixes = paths};
    const auto resp = send(http::Method::DELETE, storageUrl("object/" + escape(bucketId)), hdrs, toJsonBody(payload));
    return parseResponse<std::vector<FileObject>>(resp, "deleteFiles");
}

std::vector<FileObject> StorageClient::listFiles(const std::string& bucketId,
                                                 const std::optional<std::string>& path,
                                                 const std::optional<FileSearchOptions>& options) const {
    const ListFilesPayload payload{
        .prefix = path.value_or(""),
        .options = options.value_or(FileSearchOptions{})
    };

    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const auto resp = send(http::Method::POST, storageUrl("object/list/" + escape(bucketId)), hdrs, toJsonBody(payload));
    return parseResponse<std::vector<FileObject>>(resp, "listFiles");
}

std::string StorageClient::copyFile(const std::string& fromBucket, const std::optional<std::string>& toBucket,
                                    const std::string& fromPath, const std::optional<std::string>& toPath,
                                    const bool copyMetadata) const {
    const CopyFilePayload payload{
        .bucket_id = fromBucket,
        .source_key = fromPath,
        .destination_bucket = toBucket.value_or(fromBucket),
        .destination_key = toPath.value_or(fromPath),
        .copy_metadata = copyMetadata
    };

    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const auto resp = send(http::Method::POST, storageUrl("object/copy"), hdrs, toJsonBody(payload));
    return parseResponse<KeyResponse>(resp, "copyFile").key;
}

std::string StorageClient::moveFile(const std::string& fromBucket, const std::optional<std::string>& toBucket,
                                    const std::string& fromPath, const std::string& toPath) const {
    const MoveFilePayload payload{
        .bucket_id = fromBucket,
        .source_key = fromPath,
        .destination_bucket = toBucket.value_or(fromBucket),
        .destination_key = toPath
    };

    auto hdrs = authHeaders();
    hdrs.insert_or_assign("Content-Type", "application/json");

    const auto resp = send(http::Method::POST, storageUrl("object/move"), hdrs, toJsonBody(payload));
    return parseResponse<MessageResponse>(resp, "moveFile").message;
}
