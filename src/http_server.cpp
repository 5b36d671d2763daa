#include "http_server.hpp"
#include "http_error.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace qh {

namespace {

constexpr std::chrono::milliseconds kAcceptBackoff{100};
constexpr std::chrono::seconds kHandlerDrainTimeout{2};

} // namespace

HttpServer::HttpServer(const ServerConfig& config)
    : config_(config)
    , handler_(config)
    , port_(config.port)
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_.load()) return true;
    if (thread_.joinable()) {
        stop();  // reap an accept loop that left on its own
    }
    connections_ = std::make_shared<ConnectionRegistry>();

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("HTTP: Invalid bind address '{}'", config_.bind_address);
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::warn("HTTP: SO_REUSEADDR failed: {}", std::strerror(errno));
    }

    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to {}:{}: {}",
                      config_.bind_address, config_.port, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, config_.backlog) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, (sockaddr*)&bound, &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this, server_fd_);
    spdlog::info("HTTP server listening on http://{}:{} (root: {}, {})",
                 config_.bind_address, port_, config_.doc_root,
                 config_.thread_per_connection ? "thread per connection" : "sequential");
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    // Unblock handlers stuck reading from clients that never finish
    if (connections_) {
        std::lock_guard<std::mutex> lock(connections_->mutex);
        connections_->closed = true;
        for (int fd : connections_->fds) {
            shutdown(fd, SHUT_RDWR);
        }
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    if (connections_) {
        std::unique_lock<std::mutex> lock(connections_->mutex);
        bool drained = connections_->idle.wait_for(lock, kHandlerDrainTimeout, [this] {
            return connections_->fds.empty();
        });
        if (!drained) {
            spdlog::warn("HTTP: {} connection handler(s) still running after stop",
                         connections_->fds.size());
        }
    }
}

size_t HttpServer::active_connections() const {
    if (!connections_) return 0;
    std::lock_guard<std::mutex> lock(connections_->mutex);
    return connections_->fds.size();
}

AcceptAction accept_error_action(int err) {
    switch (err) {
        case EINTR:
        case ECONNABORTED:
        case EPROTO:
        case EAGAIN:
        // Pending network errors of the new socket, reported by accept() on Linux
        case ENETDOWN:
        case ENOPROTOOPT:
        case EHOSTDOWN:
        case ENONET:
        case EHOSTUNREACH:
        case EOPNOTSUPP:
        case ENETUNREACH:
            return AcceptAction::Retry;
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
            return AcceptAction::BackOff;
        default:
            return AcceptAction::Stop;
    }
}

void HttpServer::server_thread(int listen_fd) {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(listen_fd, (sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            int err = errno;
            if (!running_.load()) break;

            switch (accept_error_action(err)) {
                case AcceptAction::Retry:
                    spdlog::debug("HTTP: Accept failed: {}", std::strerror(err));
                    continue;
                case AcceptAction::BackOff:
                    spdlog::error("HTTP: Accept failed: {}, retrying in {} ms",
                                  std::strerror(err), kAcceptBackoff.count());
                    std::this_thread::sleep_for(kAcceptBackoff);
                    continue;
                case AcceptAction::Stop:
                    break;
            }
            spdlog::error("HTTP: Accept failed: {}, no longer accepting connections",
                          std::strerror(err));
            running_.store(false);
            break;
        }

        if (!track(*connections_, client_fd)) {
            close(client_fd);  // stop() already ran
            break;
        }

        if (config_.thread_per_connection) {
            // Each handler owns its copy of the FileHandler, so it may outlive the server
            std::thread([handler = handler_, connections = connections_, client_fd]() {
                handle_client(client_fd, handler);
                release(*connections, client_fd);
            }).detach();
        } else {
            handle_client(client_fd, handler_);
            release(*connections_, client_fd);
        }
    }
}

bool HttpServer::track(ConnectionRegistry& registry, int fd) {
    std::lock_guard<std::mutex> lock(registry.mutex);
    if (registry.closed) return false;
    registry.fds.insert(fd);
    return true;
}

// Closes under the lock so stop() never shuts down a reused fd number.
void HttpServer::release(ConnectionRegistry& registry, int fd) {
    std::lock_guard<std::mutex> lock(registry.mutex);
    close(fd);
    registry.fds.erase(fd);
    if (registry.fds.empty()) {
        registry.idle.notify_all();
    }
}

void HttpServer::handle_client(int client_fd, const FileHandler& handler) {
    RequestBuffer buf;
    std::string response;

    try {
        std::string_view raw = read_request(client_fd, buf);
        if (raw.empty()) return;  // nothing sent
        response = handler.respond(raw);
    } catch (const HttpError& e) {
        spdlog::warn("HTTP: Rejected request ({}): {}", e.http_status(), e.what());
        response = build_error_response(e.http_status());
    } catch (const std::system_error& e) {
        spdlog::error("HTTP: Connection read failed: {}", e.what());
        return;
    } catch (const std::exception& e) {
        spdlog::error("HTTP: Request handling failed: {}", e.what());
        response = build_error_response(500);
    }

    if (!send_all(client_fd, response)) {
        spdlog::error("HTTP: Connection write failed: {}", std::strerror(errno));
    }
}

bool HttpServer::send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

} // namespace qh
