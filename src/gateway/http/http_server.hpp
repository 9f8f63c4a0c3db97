#pragma once

#include "errors.hpp"
#include "http/router.hpp"
#include "service/worker_pool.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>

struct ServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    uint32_t io_threads = 4;
    uint32_t handler_threads = 8;
    uint64_t body_limit = 1024 * 1024;
};

// HTTP/1.1 front end. I/O threads only move bytes; Router::handle runs on a
// separate handler pool because transcription requests block for seconds.
class HttpServer {
public:
    HttpServer(Router& router, ServerOptions opts);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts accepting. Fails with InvalidConfig on bind errors.
    std::expected<void, Error> start();

    // Blocks until SIGINT/SIGTERM or stop().
    void run();

    void stop();

    uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
