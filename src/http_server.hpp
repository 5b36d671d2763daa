#pragma once

#include "config.hpp"
#include "file_handler.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <unordered_set>

namespace qh {

// What the accept loop does after accept() fails with a given errno.
enum class AcceptAction {
    Retry,    // transient, try again immediately
    BackOff,  // out of fds or memory, sleep before retrying
    Stop,     // leave the accept loop
};

AcceptAction accept_error_action(int err);

// Static file server: one request per connection, always "Connection: close".
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();

    // Stops accepting, shuts down in-flight connections and waits (bounded)
    // for their handlers to finish.
    void stop();
    bool is_running() const { return running_.load(); }

    // Bound port; differs from the configured one when that was 0
    uint16_t port() const { return port_; }

    // Connections accepted and not yet closed
    size_t active_connections() const;

    // Read one request from client_fd, answer it. Does not close the fd.
    static void handle_client(int client_fd, const FileHandler& handler);

private:
    // Open client fds, shared with detached handler threads so it may
    // outlive the server.
    struct ConnectionRegistry {
        std::mutex mutex;
        std::condition_variable idle;
        std::unordered_set<int> fds;
        bool closed = false;
    };

    void server_thread(int listen_fd);
    static bool track(ConnectionRegistry& registry, int fd);
    static void release(ConnectionRegistry& registry, int fd);
    static bool send_all(int fd, std::string_view data);

    ServerConfig config_;
    FileHandler handler_;
    uint16_t port_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::shared_ptr<ConnectionRegistry> connections_;
};

} // namespace qh
