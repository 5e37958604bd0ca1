#include "MockTransport.hpp"
#include "storage/errors.hpp"

using namespace sbs::storage;
using namespace sbs::storage::model;
using sbs::http::Method;

TEST_F(StorageClientTest, CreateSignedUrlIsAbsolute) {
    respond(200, R"({"signedURL":"/object/sign/b/dir/a.txt?token=eyJhbGciOi"})");

    const auto signedUrl = client_.createSignedUrl("b", "dir/a.txt", 60);

    EXPECT_EQ(signedUrl, "https://abc.supabase.co/storage/v1/object/sign/b/dir/a.txt?token=eyJhbGciOi");
    EXPECT_EQ(last_.method, Method::POST);
    EXPECT_EQ(last_.url, url("object/sign/b/dir/a.txt"));
    const auto body = lastBody();
    EXPECT_EQ(body["expiresIn"], 60);
    EXPECT_FALSE(body.contains("transform"));
}

TEST_F(StorageClientTest, CreateSignedUrlWithTransform) {
    respond(200, R"({"signedURL":"/render/image/sign/b/p.png?token=t"})");

    TransformOptions t;
    t.width = 200;
    t.resize = "contain";
    t.format = "origin";
    client_.createSignedUrl("b", "p.png", 3600, t);

    const auto transform = lastBody()["transform"];
    EXPECT_EQ(transform["width"], 200);
    EXPECT_EQ(transform["resize"], "contain");
    EXPECT_EQ(transform["format"], "origin");
    EXPECT_FALSE(transform.contains("height"));
    EXPECT_FALSE(transform.contains("quality"));
}

TEST_F(StorageClientTest, CreateSignedUrlForMissingObject) {
    respond(400, R"({"statusCode":"404","error":"not_found","message":"Object not found"})");
    EXPECT_THROW((void)client_.createSignedUrl("b", "nope.txt", 60), StorageError);
}

TEST_F(StorageClientTest, CreateMultipleSignedUrls) {
    respond(200, R"([
        {"path":"a.txt","signedURL":"/object/sign/b/a.txt?token=1","error":null},
        {"path":"gone.txt","signedURL":null,"error":"Either the object does not exist or you do not have access to it"}
    ])");

    const auto urls = client_.createMultipleSignedUrls("b", {"a.txt", "gone.txt"}, 120);

    EXPECT_EQ(last_.url, url("object/sign/b"));
    const auto body = lastBody();
    EXPECT_EQ(body["expiresIn"], 120);
    EXPECT_EQ(body["paths"], nlohmann::json({"a.txt", "gone.txt"}));

    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0].path, "a.txt");
    EXPECT_EQ(urls[0].signed_url.value_or(""), "https://abc.supabase.co/storage/v1/object/sign/b/a.txt?token=1");
    EXPECT_FALSE(urls[0].error.has_value());
    EXPECT_FALSE(urls[1].signed_url.has_value());
    EXPECT_TRUE(urls[1].error.has_value());
}

TEST_F(StorageClientTest, CreateSignedUploadUrlExtractsToken) {
    respond(200, R"({"url":"/object/upload/sign/b/new.txt?token=abc.def%2Bghi"})");

    const auto upload = client_.createSignedUploadUrl("b", "new.txt");

    EXPECT_EQ(last_.method, Method::POST);
    EXPECT_EQ(last_.url, url("object/upload/sign/b/new.txt"));
    EXPECT_FALSE(hasHeader("x-upsert"));
    EXPECT_FALSE(hasHeader("Content-Type"));
    EXPECT_TRUE(last_.body.empty());
    EXPECT_EQ(upload.url, "/object/upload/sign/b/new.txt?token=abc.def%2Bghi");
    EXPECT_EQ(upload.token, "abc.def+ghi");
}

TEST_F(StorageClientTest, CreateSignedUploadUrlWithUpsert) {
    respond(200, R"({"url":"/object/upload/sign/b/new.txt?token=t"})");
    (void)client_.createSignedUploadUrl("b", "new.txt", true);
    EXPECT_EQ(header("x-upsert"), "true");
}

TEST_F(StorageClientTest, SignedUploadUrlWithoutTokenIsStorageError) {
    respond(200, R"({"url":"/object/upload/sign/b/new.txt"})");

    try {
        (void)client_.createSignedUploadUrl("b", "new.txt");
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.status(), 200);
        EXPECT_EQ(e.body(), R"({"url":"/object/upload/sign/b/new.txt"})");
    }
}

TEST_F(StorageClientTest, UploadToSignedUrlPutsWithToken) {
    respond(200, R"({"Key":"b/new.txt"})");

    const std::vector<uint8_t> data{'d', 'a', 't', 'a'};
    const auto res = client_.uploadToSignedUrl("b", "tok+en", data, "new.txt");

    EXPECT_EQ(last_.method, Method::PUT);
    EXPECT_EQ(last_.url, url("object/upload/sign/b/new.txt?token=tok%2Ben"));
    EXPECT_EQ(last_.body, "data");
    EXPECT_EQ(header("cache-control"), "max-age=3600");
    EXPECT_EQ(res.key, "b/new.txt");
    EXPECT_FALSE(res.id.has_value());
}

// ###########################################################################
// ############################### PUBLIC URL ################################
// ###########################################################################

TEST_F(StorageClientTest, PublicUrlIsBuiltLocally) {
    EXPECT_CALL(*transport_, perform(::testing::_)).Times(0);

    EXPECT_EQ(client_.getPublicUrl("public-bucket", "dir/a b.png"),
              "https://abc.supabase.co/storage/v1/object/public/public-bucket/dir/a%20b.png");
}

TEST_F(StorageClientTest, PublicUrlWithDownloadFlag) {
    const DownloadOptions opts{.transform = std::nullopt, .download = true};
    EXPECT_EQ(client_.getPublicUrl("b", "a.txt", opts),
              "https://abc.supabase.co/storage/v1/object/public/b/a.txt?download=true");

    const DownloadOptions noDownload{.transform = std::nullopt, .download = false};
    EXPECT_EQ(client_.getPublicUrl("b", "a.txt", noDownload),
              "https://abc.supabase.co/storage/v1/object/public/b/a.txt");
}

TEST_F(StorageClientTest, PublicUrlWithTransformUsesRenderSegment) {
    TransformOptions t;
    t.width = 100;
    t.height = 100;
    t.resize = "cover";

    const DownloadOptions opts{.transform = t, .download = true};
    EXPECT_EQ(client_.getPublicUrl("b", "p.png", opts),
              "https://abc.supabase.co/storage/v1/render/image/public/b/p.png?width=100&height=100&resize=cover&download=true");
}

TEST_F(StorageClientTest, PublicUrlDropsUnknownResizeMode) {
    TransformOptions t;
    t.width = 64;
    t.resize = "stretch";

    const DownloadOptions opts{.transform = t, .download = std::nullopt};
    EXPECT_EQ(client_.getPublicUrl("b", "p.png", opts),
              "https://abc.supabase.co/storage/v1/render/image/public/b/p.png?width=64");
}
