#include "file_handler.hpp"
#include "http_response.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace qh;

namespace {

class FileHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_.write("xd.html", "<p>default</p>");
        root_.write("style.css", "body { color: red; }");
        root_.write("img.bin", std::string("\x01\x02\x00\x03", 4));
        root_.write("logo.png", std::string("\x89PNG\r\n\x1a\n", 8));
        config_.doc_root = root_.path().string();
    }

    std::string respond(std::string_view raw) const {
        return FileHandler(config_).respond(raw);
    }

    test::TempDir root_;
    ServerConfig config_;
};

std::string status_line(const std::string& resp) {
    return resp.substr(0, resp.find("\r\n"));
}

} // namespace

TEST_F(FileHandlerTest, RootServesDefaultFile) {
    EXPECT_EQ(respond("GET / HTTP/1.1\r\nHost: x\r\n\r\n"),
              build_ok_response("text/html", "<p>default</p>"));
}

TEST_F(FileHandlerTest, ConfiguredDefaultFile) {
    root_.write("home.html", "home");
    config_.default_file = "/home.html";
    EXPECT_EQ(respond("GET / HTTP/1.1\r\n\r\n"), build_ok_response("text/html", "home"));
}

TEST_F(FileHandlerTest, ContentTypeFollowsExtension) {
    EXPECT_EQ(respond("GET /style.css HTTP/1.1\r\n\r\n"),
              build_ok_response("text/css", "body { color: red; }"));
    EXPECT_EQ(respond("GET /img.bin HTTP/1.1\r\n\r\n"),
              build_ok_response("application/octet-stream", std::string("\x01\x02\x00\x03", 4)));
}

TEST_F(FileHandlerTest, BodyIsByteIdentical) {
    const std::string png("\x89PNG\r\n\x1a\n", 8);
    std::string resp = respond("GET /logo.png HTTP/1.1\r\nUser-Agent: test\r\n\r\n");
    EXPECT_NE(resp.find("Content-Type: image/png\r\n"), std::string::npos);
    EXPECT_NE(resp.find("Content-Length: 8\r\n"), std::string::npos);
    EXPECT_EQ(resp.substr(resp.find("\r\n\r\n") + 4), png);
}

TEST_F(FileHandlerTest, MissingFilesShareOne404) {
    EXPECT_EQ(respond("GET /missing.html HTTP/1.1\r\n\r\n"), not_found_response());
    EXPECT_EQ(respond("GET /other/deep/thing HTTP/1.1\r\n\r\n"), not_found_response());
    EXPECT_EQ(respond("GET /../../etc/passwd HTTP/1.1\r\n\r\n"), not_found_response());
}

TEST_F(FileHandlerTest, UnsupportedMethodIs405) {
    EXPECT_EQ(respond("POST /x HTTP/1.1\r\n\r\n"), build_error_response(405));
}

TEST_F(FileHandlerTest, UnsupportedProtocolIs505) {
    EXPECT_EQ(respond("GET /x HTTP/1.0\r\n\r\n"), build_error_response(505));
}

TEST_F(FileHandlerTest, MalformedHeaderIs400) {
    EXPECT_EQ(respond("GET /style.css HTTP/1.1\r\nHost: x\r\nBadHeaderNoColon\r\n\r\n"),
              build_error_response(400));
    EXPECT_EQ(respond("GET\r\n\r\n"), build_error_response(400));
}

TEST_F(FileHandlerTest, TruncatedRequestStillParses) {
    // Peer closed before the blank line
    EXPECT_EQ(status_line(respond("GET /style.css HTTP/1.1\r\nHost: x\r\n")), "HTTP/1.1 200 OK ");
    EXPECT_EQ(status_line(respond("GET /style.css HTTP/1.1\r\nHos")), "HTTP/1.1 400 BAD REQUEST ");
}

TEST_F(FileHandlerTest, BytesAfterHeaderBlockAreIgnored) {
    EXPECT_EQ(status_line(respond("GET /style.css HTTP/1.1\r\n\r\nnot a header")),
              "HTTP/1.1 200 OK ");
}

TEST_F(FileHandlerTest, DirectoryIs500) {
    root_.write("dir/inner.html", "x");
    EXPECT_EQ(respond("GET /dir HTTP/1.1\r\n\r\n"), build_error_response(500));
}
