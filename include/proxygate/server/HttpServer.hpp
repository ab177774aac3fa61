#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace proxygate::server {

class Router;

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io,
               std::shared_ptr<Router> router,
               std::string host,
               unsigned short port);

    // Throws boost::system::system_error if the endpoint cannot be bound.
    void start();
    void stop();

private:
    void doAccept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<Router> router_;
    std::string host_;
    unsigned short port_{};
    std::atomic<bool> running_{false};
};

} // namespace proxygate::server
