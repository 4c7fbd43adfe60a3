/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/http.hpp"
#include "sift/server.hpp"
#include "sift/logger.hpp"
#include <httplib.h>

namespace sift {

namespace {

constexpr const char* kHtml = "text/html; charset=utf-8";
constexpr const char* kText = "text/plain; charset=utf-8";

void notFound(httplib::Response& res, const std::string& body = "404 page not found\n") {
    res.status = 404;
    res.set_content(body, kText);
}

// Wraps a handler so an escaping exception becomes a logged 500.
template <typename Handler>
httplib::Server::Handler guarded(Handler handler) {
    return [handler](const httplib::Request& req, httplib::Response& res) {
        try {
            handler(req, res);
        } catch (const std::exception& e) {
            LOG_ERROR("Request failed: " + req.path + " [" + e.what() + "]");
            res.status = 500;
            res.set_content("internal error\n", kText);
        }
    };
}

}

HttpFrontend::HttpFrontend(Server& server, std::string host, std::uint16_t port, int workers)
    : server_(server), host_(std::move(host)), port_(port), workers_(workers < 1 ? 1 : workers) {
}

HttpFrontend::~HttpFrontend() {
    stop();
}

bool HttpFrontend::start() {
    if (running_.load()) {
        LOG_WARN("HTTP frontend already running");
        return false;
    }

    try {
        http_ = std::make_unique<httplib::Server>();

        const auto workers = static_cast<std::size_t>(workers_);
        http_->new_task_queue = [workers] {
            return new httplib::ThreadPool(workers, kMaxQueuedConnections);
        };
        configureRoutes(*http_);

        int bound = port_;
        if (port_ == 0) {
            bound = http_->bind_to_any_port(host_);
        } else if (!http_->bind_to_port(host_, port_)) {
            bound = -1;
        }
        if (bound < 0) {
            LOG_ERROR("bind failed on " + host_ + ":" + std::to_string(port_));
            http_.reset();
            return false;
        }
        boundPort_ = static_cast<std::uint16_t>(bound);

        running_.store(true);
        listenThread_ = std::thread([this] {
            setThreadName("Http");
            if (!http_->listen_after_bind()) {
                LOG_DEBUG("HTTP listener exited");
            }
        });

        http_->wait_until_ready();
        if (!http_->is_running()) {
            LOG_ERROR("HTTP frontend failed to start listening");
            stop();
            return false;
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start HTTP frontend: " + std::string(e.what()));
        stop();
        return false;
    }

    LOG_DEBUG("HTTP frontend listening on " + host_ + ":" + std::to_string(boundPort_) +
              " with " + std::to_string(workers_) + " workers");
    return true;
}

void HttpFrontend::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    if (http_) {
        http_->stop();
    }
    if (listenThread_.joinable()) {
        listenThread_.join();
    }
    http_.reset();

    LOG_DEBUG("HTTP frontend stopped");
}

void HttpFrontend::configureRoutes(httplib::Server& http) {
    http.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        if (req.method == "GET") {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        res.status = 405;
        res.set_content("method not allowed\n", kText);
        return httplib::Server::HandlerResponse::Handled;
    });

    http.Get("/", guarded([this](const httplib::Request&, httplib::Response& res) {
        handleRoot(res);
    }));
    http.Get("/stats", guarded([this](const httplib::Request&, httplib::Response& res) {
        handleStats(res);
    }));
    http.Get("/exit", guarded([this](const httplib::Request&, httplib::Response& res) {
        handleExit(res);
    }));
    http.Get(R"(/(accept|reject|view)/(\d+))", guarded([this](const httplib::Request& req, httplib::Response& res) {
        const std::string action = req.matches[1].str();
        const std::string idText = req.matches[2].str();
        if (action == "view") {
            handleView(idText, res);
        } else {
            handleMove(action, idText, res);
        }
    }));

    http.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_TRACE(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

void HttpFrontend::handleRoot(httplib::Response& res) {
    auto next = server_.next();
    if (next) {
        res.set_redirect("/view/" + std::to_string(*next));
        return;
    }

    res.set_content("<!DOCTYPE html>\n<html><head><title>sift</title></head>\n"
                    "<body><h1>Nothing left to review</h1></body></html>\n",
                    kHtml);
}

void HttpFrontend::handleView(const std::string& idText, httplib::Response& res) {
    auto id = parseItemId(idText);
    if (!id) {
        LOG_DEBUG("Load failed: ID: " + idText);
        notFound(res);
        return;
    }

    LoadResult loaded = server_.view(*id);
    if (!loaded) {
        if (loaded.error == LoadError::IoError) {
            LOG_WARN("Load failed: ID: " + idText + " [" + loaded.message + "]");
            notFound(res);
            return;
        }
        LOG_DEBUG("Load failed: ID: " + idText + " [" + loaded.message + "]");
        auto stage = server_.locate(*id);
        if (stage) {
            notFound(res, "item " + idText + " is in " + stageName(*stage) + "\n");
        } else {
            notFound(res);
        }
        return;
    }

    const std::string name = std::to_string(*id);
    res.set_content(
        "<!DOCTYPE html>\n<html><head><title>Item " + name + "</title></head>\n<body>\n"
        "<h1>Item " + name + "</h1>\n"
        "<pre>" + htmlEscape(loaded.item.content) + "</pre>\n"
        "<p><a href=\"/accept/" + name + "\">Accept</a> | "
        "<a href=\"/reject/" + name + "\">Reject</a></p>\n"
        "</body></html>\n",
        kHtml);
}

void HttpFrontend::handleMove(const std::string& action, const std::string& idText, httplib::Response& res) {
    auto id = parseItemId(idText);
    if (!id) {
        LOG_DEBUG("Move ignored: ID: " + idText);
        notFound(res);
        return;
    }

    EnqueueResult queued = action == "accept" ? server_.accept(*id) : server_.reject(*id);
    if (!queued) {
        LOG_WARN("Move not queued: ID: " + idText + " [" + queued.message + "]");
        res.status = 503;
        res.set_content(queued.message + "\n", kText);
        return;
    }

    redirectToNext(res);
}

void HttpFrontend::handleStats(httplib::Response& res) {
    res.set_content(server_.statusReport(), kText);
}

void HttpFrontend::handleExit(httplib::Response& res) {
    LOG_INFO("Exit requested over HTTP");
    server_.requestShutdown();
    res.set_content("Terminating server...", kText);
}

void HttpFrontend::redirectToNext(httplib::Response& res) {
    auto next = server_.next();
    res.set_redirect(next ? "/view/" + std::to_string(*next) : std::string("/"));
}

std::string HttpFrontend::htmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&#34;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

}
