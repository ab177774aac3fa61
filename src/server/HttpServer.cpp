#include "proxygate/server/HttpServer.hpp"
#include "proxygate/server/RequestContext.hpp"
#include "proxygate/server/Router.hpp"
#include "proxygate/util/Logging.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace proxygate::server {
namespace {

constexpr std::uint64_t kMaxRequestBody = 10ull * 1024 * 1024;
constexpr std::chrono::seconds kIdleTimeout{60};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Router> router)
        : stream_(std::move(socket)), router_(std::move(router)) {}

    void start() { readRequest(); }

private:
    void readRequest() {
        parser_.emplace();
        parser_->body_limit(kMaxRequestBody);
        stream_.expires_after(kIdleTimeout);
        boost::beast::http::async_read(stream_, buffer_, *parser_,
            boost::beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(boost::system::error_code ec, std::size_t) {
        if (ec == boost::beast::http::error::end_of_stream) {
            doClose();
            return;
        }
        if (ec) {
            if (ec != boost::beast::error::timeout && ec != boost::asio::error::operation_aborted) {
                util::log(util::LogLevel::debug, "HTTP read failed: " + ec.message());
            }
            doClose();
            return;
        }
        dispatch();
    }

    void dispatch() {
        RequestContext ctx;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = parser_->release();
        ctx.response.version(ctx.request.version());

        router_->dispatch(ctx);

        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());

        if (util::isLogEnabled(util::LogLevel::debug)) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - ctx.startedAt);
            util::log(util::LogLevel::debug,
                      std::string(ctx.request.method_string()) + " " + std::string(ctx.request.target()) + " -> " +
                          std::to_string(ctx.response.result_int()) + " (" + std::to_string(elapsed.count()) + "ms)");
        }

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        stream_.expires_after(kIdleTimeout);
        boost::beast::http::async_write(stream_, *response,
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                if (!response->keep_alive()) {
                    self->doClose();
                    return;
                }
                self->readRequest();
            });
    }

    void doClose() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<Router> router_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io,
                       std::shared_ptr<Router> router,
                       std::string host,
                       unsigned short port)
    : io_(io)
    , acceptor_(boost::asio::make_strand(io))
    , router_(std::move(router))
    , host_(std::move(host))
    , port_(port) {}

void HttpServer::start() {
    if (running_) {
        return;
    }

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(host_), port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    running_ = true;
    doAccept();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // Accept completions run on the acceptor's strand; close it from there too.
    boost::asio::dispatch(acceptor_.get_executor(), [self = shared_from_this()]() {
        boost::system::error_code ec;
        self->acceptor_.cancel(ec);
        self->acceptor_.close(ec);
    });
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }

            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), self->router_)->start();
            }

            self->doAccept();
        });
}

} // namespace proxygate::server
