#pragma once

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace qh::test {

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("quiche_httpd_test_" + std::to_string(getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    void write(const std::string& rel, std::string_view content) const {
        auto full = path_ / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

private:
    std::filesystem::path path_;
};

// Connected AF_UNIX stream pair; [0] plays the server, [1] the client.
class SocketPair {
public:
    SocketPair() {
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds_) != 0) {
            ADD_FAILURE() << "socketpair failed";
            fds_[0] = fds_[1] = -1;
        }
    }

    ~SocketPair() {
        if (fds_[0] >= 0) close(fds_[0]);
        if (fds_[1] >= 0) close(fds_[1]);
    }

    int server() const { return fds_[0]; }
    int client() const { return fds_[1]; }

    void client_send(std::string_view data) const {
        ASSERT_EQ(::write(fds_[1], data.data(), data.size()),
                  static_cast<ssize_t>(data.size()));
    }

    void client_finish() const { shutdown(fds_[1], SHUT_WR); }
    void server_finish() const { shutdown(fds_[0], SHUT_WR); }

    std::string client_read_all() const {
        std::string out;
        char buf[1024];
        ssize_t n;
        while ((n = ::read(fds_[1], buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

private:
    int fds_[2];
};

} // namespace qh::test
