/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace sift {

class Server;

// HTTP frontend over cpp-httplib, GET only.
//   /              redirect to the next item under review
//   /view/<id>     item page
//   /accept/<id>   queue a move to accept, redirect to the next item
//   /reject/<id>   queue a move to reject, redirect to the next item
//   /stats         per-stage counts
//   /exit          request shutdown
class HttpFrontend final {
public:
    // Connections waiting for a worker beyond this are dropped.
    static constexpr std::size_t kMaxQueuedConnections = 64;

    HttpFrontend(Server& server, std::string host, std::uint16_t port, int workers);
    ~HttpFrontend();

    HttpFrontend(const HttpFrontend&) = delete;
    HttpFrontend& operator=(const HttpFrontend&) = delete;
    HttpFrontend(HttpFrontend&&) = delete;
    HttpFrontend& operator=(HttpFrontend&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;

    // Bound port, useful when constructed with port 0.
    [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_; }

    [[nodiscard]] static std::string htmlEscape(const std::string& text);

private:
    void configureRoutes(httplib::Server& http);

    void handleRoot(httplib::Response& res);
    void handleView(const std::string& idText, httplib::Response& res);
    void handleMove(const std::string& action, const std::string& idText, httplib::Response& res);
    void handleStats(httplib::Response& res);
    void handleExit(httplib::Response& res);
    void redirectToNext(httplib::Response& res);

    Server& server_;
    std::string host_;
    std::uint16_t port_;
    int workers_;
    std::uint16_t boundPort_ = 0;

    std::atomic<bool> running_{false};
    std::unique_ptr<httplib::Server> http_;
    std::thread listenThread_;
};

}
