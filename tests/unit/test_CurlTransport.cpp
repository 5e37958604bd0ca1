#include "http/CurlTransport.hpp"
#include "storage/errors.hpp"

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sbs::http;

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

// Accepts one connection on 127.0.0.1, records the raw request and answers with a canned response.
class LoopbackServer {
public:
    explicit LoopbackServer(std::string response) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket() failed");

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd_, 1) < 0) {
            ::close(fd_);
            throw std::runtime_error("bind/listen on loopback failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, response = std::move(response)] { serveOnce(response); });
    }

    ~LoopbackServer() {
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    const std::string& request() {
        if (thread_.joinable()) thread_.join();
        return request_;
    }

    std::string requestLine() {
        const auto& raw = request();
        return raw.substr(0, raw.find("\r\n"));
    }

    std::vector<std::string> headerValues(const std::string& name) {
        const auto& raw = request();
        const auto end = raw.find("\r\n\r\n");
        std::vector<std::string> values;

        size_t pos = raw.find("\r\n") + 2;
        while (pos < end) {
            const auto eol = raw.find("\r\n", pos);
            const auto line = raw.substr(pos, eol - pos);
            const auto colon = line.find(':');
            if (colon != std::string::npos && lower(line.substr(0, colon)) == lower(name)) {
                auto value = line.substr(colon + 1);
                value.erase(0, value.find_first_not_of(' '));
                values.push_back(value);
            }
            pos = eol + 2;
        }
        return values;
    }

    std::string body() {
        const auto& raw = request();
        return raw.substr(raw.find("\r\n\r\n") + 4);
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::string request_;

    void serveOnce(const std::string& response) {
        const int conn = ::accept(fd_, nullptr, nullptr);
        if (conn < 0) return;

        std::string buf;
        char chunk[4096];
        size_t headerEnd = std::string::npos;
        size_t contentLength = 0;

        while (true) {
            if (headerEnd == std::string::npos && (headerEnd = buf.find("\r\n\r\n")) != std::string::npos) {
                const auto head = lower(buf.substr(0, headerEnd));
                if (const auto cl = head.find("\r\ncontent-length:"); cl != std::string::npos)
                    contentLength = std::stoul(head.substr(cl + 17));
            }
            if (headerEnd != std::string::npos && buf.size() >= headerEnd + 4 + contentLength) break;

            const auto n = ::recv(conn, chunk, sizeof(chunk), 0);
            if (n <= 0) break;
            buf.append(chunk, static_cast<size_t>(n));
        }

        request_ = std::move(buf);
        ::send(conn, response.data(), response.size(), MSG_NOSIGNAL);
        ::close(conn);
    }
};

constexpr auto OK_RESPONSE = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok";

}

class CurlTransportTest : public ::testing::Test {
protected:
    // keep loopback traffic away from any proxy configured in the environment
    void SetUp() override {
        ::setenv("no_proxy", "127.0.0.1", 1);
        ::setenv("NO_PROXY", "127.0.0.1", 1);
    }
};

TEST_F(CurlTransportTest, BodylessPostSendsNoContentType) {
    LoopbackServer server(OK_RESPONSE);

    Request req;
    req.method = Method::POST;
    req.url = server.url("/storage/v1/bucket/b/empty");
    req.headers = {{"apikey", "k"}};

    const auto resp = CurlTransport().perform(req);

    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "ok");
    EXPECT_EQ(server.requestLine(), "POST /storage/v1/bucket/b/empty HTTP/1.1");
    EXPECT_TRUE(server.headerValues("Content-Type").empty());
    EXPECT_EQ(server.headerValues("Content-Length"), std::vector<std::string>{"0"});
    EXPECT_EQ(server.headerValues("apikey"), std::vector<std::string>{"k"});
    EXPECT_TRUE(server.headerValues("Expect").empty());
}

TEST_F(CurlTransportTest, JsonPostKeepsCallerContentType) {
    LoopbackServer server(OK_RESPONSE);

    Request req;
    req.method = Method::POST;
    req.url = server.url("/storage/v1/object/list/b");
    req.headers = {{"Content-Type", "application/json"}};
    req.body = R"({"prefix":""})";

    (void)CurlTransport().perform(req);

    EXPECT_EQ(server.headerValues("content-type"), std::vector<std::string>{"application/json"});
    EXPECT_EQ(server.body(), R"({"prefix":""})");
}

TEST_F(CurlTransportTest, PutSendsRawBytes) {
    LoopbackServer server(OK_RESPONSE);

    Request req;
    req.method = Method::PUT;
    req.url = server.url("/storage/v1/object/b/a.bin");
    req.headers = {{"content-type", "application/octet-stream"}};
    req.body = std::string("\x00\x01\xff", 3);

    (void)CurlTransport().perform(req);

    EXPECT_EQ(server.requestLine(), "PUT /storage/v1/object/b/a.bin HTTP/1.1");
    EXPECT_EQ(server.headerValues("Content-Type"), std::vector<std::string>{"application/octet-stream"});
    EXPECT_EQ(server.body(), std::string("\x00\x01\xff", 3));
}

TEST_F(CurlTransportTest, BodylessDeleteAndGet) {
    {
        LoopbackServer server(OK_RESPONSE);
        Request req;
        req.method = Method::DELETE;
        req.url = server.url("/storage/v1/bucket/b");
        (void)CurlTransport().perform(req);

        EXPECT_EQ(server.requestLine(), "DELETE /storage/v1/bucket/b HTTP/1.1");
        EXPECT_TRUE(server.headerValues("Content-Type").empty());
        EXPECT_TRUE(server.body().empty());
    }
    {
        LoopbackServer server(OK_RESPONSE);
        Request req;
        req.url = server.url("/storage/v1/bucket");
        (void)CurlTransport().perform(req);

        EXPECT_EQ(server.requestLine(), "GET /storage/v1/bucket HTTP/1.1");
        EXPECT_TRUE(server.headerValues("Content-Type").empty());
    }
}

TEST_F(CurlTransportTest, ErrorStatusIsAResponse) {
    LoopbackServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\nConnection: close\r\n\r\nnot found");

    Request req;
    req.url = server.url("/storage/v1/bucket/missing");

    const auto resp = CurlTransport().perform(req);
    EXPECT_FALSE(resp.ok());
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body, "not found");
}

TEST_F(CurlTransportTest, UnreachableHostIsTransportError) {
    // grab a free port, then close it so nothing is listening
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);

    Request req;
    req.url = "http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port)) + "/storage/v1/bucket";

    EXPECT_THROW((void)CurlTransport().perform(req), sbs::storage::TransportError);
}
