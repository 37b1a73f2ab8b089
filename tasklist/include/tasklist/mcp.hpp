#pragma once
// MCP Server: Model Context Protocol over a line stream
//
// Newline-delimited JSON-RPC 2.0, stdin/stdout by default. Each request
// is handed to a worker so slow and fast calls overlap; all workers share
// one TaskStore. Responses are written as whole lines, in completion order.

#include "mcp/handler.hpp"
#include "log.hpp"
#include "task_store.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <cstddef>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace tasklist {

struct ServerOptions {
    size_t workers = 4;
};

class MCPServer {
public:
    explicit MCPServer(std::shared_ptr<TaskStore> store,
                       ServerOptions options = {},
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout)
        : handler_(std::move(store))
        , options_(options)
        , in_(in)
        , out_(out)
        , running_(false)
    {}

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // Serve until end of input (or stop()), then answer everything queued
    void run() {
        running_ = true;
        WorkerPool pool(options_.workers);
        log_debug("server", "serving with %zu workers", pool.size());

        std::string line;
        while (running_ && std::getline(in_, line)) {
            if (line.empty()) continue;

            received_++;
            bool queued = pool.submit([this, request = std::move(line)] {
                auto response = handler_.handle(request);
                if (!response.empty()) {
                    write_line(response);
                }
                handled_++;
            });
            if (!queued) {
                log_warn("server", "worker pool closed, dropping request");
            }
            line.clear();
        }

        pool.wait_idle();
        pool.shutdown();
        running_ = false;
        log_debug("server", "input closed after %zu requests", received_.load());
    }

    void stop() { running_ = false; }

    bool running() const { return running_; }
    size_t requests_received() const { return received_; }
    size_t requests_handled() const { return handled_; }

private:
    mcp::Handler handler_;
    ServerOptions options_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
    std::atomic<bool> running_;
    std::atomic<size_t> received_{0};
    std::atomic<size_t> handled_{0};

    void write_line(const std::string& response) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << response << "\n";
        out_.flush();
        if (!out_) {
            log_error("server", "output stream failed, stopping");
            running_ = false;
        }
    }
};

} // namespace tasklist
