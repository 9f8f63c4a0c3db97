#include "http/http_server.hpp"

#include "logging.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <format>
#include <optional>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(60);

void fail(beast::error_code ec, const char* what) {
    if (ec == net::error::operation_aborted || ec == http::error::end_of_stream ||
        ec == net::error::eof || ec == beast::error::timeout) {
        logging::debug("http: {} closed: {}", what, ec.message());
        return;
    }
    logging::warn("http: {} failed: {}", what, ec.message());
}

HttpRequest to_request(const http::request<http::string_body>& req) {
    HttpRequest out;
    out.method = std::string(req.method_string());
    out.target = std::string(req.target());
    out.body = req.body();
    for (const auto& field : req) {
        std::string name(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out.headers[name] = std::string(field.value());
    }
    return out;
}

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, Router& router, WorkerPool& handlers, uint64_t body_limit)
        : stream_(std::move(socket)), router_(router), handlers_(handlers),
          body_limit_(body_limit) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec == http::error::body_limit) {
            HttpResponse too_large{413, api::failure("Request body too large",
                                                     {{"detail", "Request body too large"}})};
            keep_alive_ = false;
            return do_write(std::move(too_large), 11);
        }
        if (ec) return fail(ec, "read");

        auto req = parser_->release();
        keep_alive_ = req.keep_alive();
        unsigned version = req.version();

        // The stream is idle until the handler posts the response back.
        stream_.expires_never();
        auto self = shared_from_this();
        handlers_.submit([self, request = to_request(req), version]() mutable {
            HttpResponse resp;
            try {
                resp = self->router_.handle(request);
            } catch (const std::exception& e) {
                logging::error("Unhandled exception: {}", e.what());
                resp = {500, api::failure("Internal server error", {{"detail", e.what()}})};
            }
            net::post(self->stream_.get_executor(),
                      [self, resp = std::move(resp), version]() mutable {
                          self->do_write(std::move(resp), version);
                      });
        });
    }

    void do_write(HttpResponse resp, unsigned version) {
        auto res = std::make_shared<http::response<http::string_body>>(
            static_cast<http::status>(resp.status), version);
        res->set(http::field::server, "stt-gateway");
        res->set(http::field::content_type, "application/json");
        res->keep_alive(keep_alive_);
        res->body() = resp.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        res->prepare_payload();

        stream_.expires_after(kReadTimeout);
        http::async_write(stream_, *res,
                          [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                              self->on_write(ec, res->need_eof());
                          });
    }

    void on_write(beast::error_code ec, bool close) {
        if (ec) return fail(ec, "write");
        if (close) return do_close();
        buffer_.consume(buffer_.size());
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    Router& router_;
    WorkerPool& handlers_;
    uint64_t body_limit_;
    bool keep_alive_ = false;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, Router& router, WorkerPool& handlers, uint64_t body_limit)
        : ioc_(ioc), acceptor_(net::make_strand(ioc)), router_(router),
          handlers_(handlers), body_limit_(body_limit) {}

    beast::error_code open(const tcp::endpoint& endpoint) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) return ec;
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) return ec;
        acceptor_.bind(endpoint, ec);
        if (ec) return ec;
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        return ec;
    }

    void run() { do_accept(); }

    void stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

    uint16_t port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

private:
    void do_accept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
            fail(ec, "accept");
        } else {
            std::make_shared<Session>(std::move(socket), router_, handlers_, body_limit_)->run();
        }
        if (acceptor_.is_open()) do_accept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Router& router_;
    WorkerPool& handlers_;
    uint64_t body_limit_;
};

} // namespace

struct HttpServer::Impl {
    Impl(Router& r, ServerOptions o)
        : router(r), opts(std::move(o)),
          ioc(static_cast<int>(std::max<uint32_t>(1, opts.io_threads))),
          signals(ioc, SIGINT, SIGTERM),
          handlers(std::max<uint32_t>(1, opts.handler_threads)) {}

    Router& router;
    ServerOptions opts;
    net::io_context ioc;
    net::signal_set signals;
    WorkerPool handlers;
    std::shared_ptr<Listener> listener;
    std::vector<std::thread> threads;
};

HttpServer::HttpServer(Router& router, ServerOptions opts)
    : impl_(std::make_unique<Impl>(router, std::move(opts))) {}

HttpServer::~HttpServer() {
    stop();
    for (auto& t : impl_->threads) {
        if (t.joinable()) t.join();
    }
}

std::expected<void, Error> HttpServer::start() {
    beast::error_code ec;
    auto address = net::ip::make_address(impl_->opts.host, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::InvalidConfig,
            "Invalid listen address " + impl_->opts.host + ": " + ec.message()});
    }

    impl_->listener = std::make_shared<Listener>(impl_->ioc, impl_->router, impl_->handlers,
                                                 impl_->opts.body_limit);
    ec = impl_->listener->open(tcp::endpoint{address, impl_->opts.port});
    if (ec) {
        return std::unexpected(Error{ErrorKind::InvalidConfig,
            std::format("Cannot listen on {}:{}: {}", impl_->opts.host, impl_->opts.port, ec.message())});
    }
    impl_->listener->run();

    impl_->signals.async_wait([this](const beast::error_code& err, int signal_number) {
        if (err) return;
        logging::info("Received signal {}, shutting down", signal_number);
        stop();
    });

    logging::info("Listening on {}:{} ({} I/O threads)", impl_->opts.host, port(),
                  impl_->opts.io_threads);
    return {};
}

void HttpServer::run() {
    uint32_t n = std::max<uint32_t>(1, impl_->opts.io_threads);
    impl_->threads.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        impl_->threads.emplace_back([this] {
            try {
                impl_->ioc.run();
            } catch (const std::exception& e) {
                logging::error("http: io thread exited: {}", e.what());
            }
        });
    }
    for (auto& t : impl_->threads) {
        if (t.joinable()) t.join();
    }
    impl_->threads.clear();

    // Let in-flight handlers finish before the router's services go away.
    impl_->handlers.shutdown();
}

void HttpServer::stop() {
    if (impl_->listener) impl_->listener->stop();
    impl_->ioc.stop();
}

uint16_t HttpServer::port() const {
    return impl_->listener ? impl_->listener->port() : 0;
}
