#include "proxygate/util/HttpClient.hpp"
#include "proxygate/util/Errors.hpp"
#include "proxygate/util/Logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace proxygate::util {
namespace {
constexpr unsigned kHttpVersion = 11;
constexpr std::uint64_t kMaxResponseBody = 64ull * 1024 * 1024;

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find('/', hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.empty()) {
        parsed.target = "/";
    }
    return parsed;
}

boost::beast::http::verb toVerb(const std::string& method) {
    std::string upper;
    upper.reserve(method.size());
    std::transform(method.begin(), method.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    auto verb = boost::beast::http::string_to_verb(upper);
    if (verb == boost::beast::http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + method);
    }
    return verb;
}

bool isAbsoluteForm(std::string_view target) {
    return target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0;
}

template <class Stream>
HttpClient::HttpResponse readResponse(Stream& stream, bool headRequest) {
    boost::beast::flat_buffer buffer;
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(kMaxResponseBody);
    if (headRequest) {
        parser.skip(true);
    }
    boost::beast::http::read(stream, buffer, parser);
    return parser.release();
}

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
}

HttpClient::HttpResponse HttpClient::fetch(const std::string& method,
                                           const std::string& url,
                                           const std::vector<Header>& headers,
                                           const std::string& body,
                                           std::chrono::seconds timeout) {
    ParsedUrl parsed = parseUrl(url);
    HttpRequest request{toVerb(method), parsed.target, kHttpVersion};
    request.set(boost::beast::http::field::host, parsed.host);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& header : headers) {
        request.set(header.name, header.value);
    }
    if (!body.empty()) {
        request.body() = body;
        request.prepare_payload();
    }

    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(parsed.host, parsed.port);
    const bool headRequest = request.method() == boost::beast::http::verb::head;

    if (parsed.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io, sslContext_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(parsed.host));
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        lowest.connect(results);
        stream.handshake(boost::asio::ssl::stream_base::client);

        boost::beast::http::write(stream, request);
        auto response = readResponse(stream, headRequest);

        boost::system::error_code ec;
        stream.shutdown(ec);
        if (ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated) {
            ec = {};
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return response;
    }

    boost::beast::tcp_stream stream(io);
    stream.expires_after(timeout);
    stream.connect(results);
    boost::beast::http::write(stream, request);
    auto response = readResponse(stream, headRequest);
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        throw boost::system::system_error(ec);
    }
    return response;
}

HttpClient::HttpResponse HttpClient::forward(HttpRequest request,
                                             const routing::RoutingDecision& decision,
                                             std::chrono::seconds timeout) {
    auto upstreamRequest = prepareUpstreamRequest(std::move(request), decision);
    const bool headRequest = upstreamRequest.method() == boost::beast::http::verb::head;

    try {
        boost::asio::io_context io;
        boost::asio::ip::tcp::resolver resolver(io);
        auto results = resolver.resolve(decision.proxy.host, std::to_string(decision.proxy.port));

        boost::beast::tcp_stream stream(io);
        stream.expires_after(timeout);
        stream.connect(results);
        boost::beast::http::write(stream, upstreamRequest);
        auto response = readResponse(stream, headRequest);

        boost::system::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != boost::asio::error::not_connected) {
            log(LogLevel::debug, "Upstream shutdown for " + decision.target + ": " + ec.message());
        }
        return response;
    } catch (const boost::system::system_error& ex) {
        throw GatewayError(ErrorCode::upstream_forwarding_error, ex.code().message());
    }
}

HttpClient::HttpRequest prepareUpstreamRequest(HttpClient::HttpRequest request,
                                               const routing::RoutingDecision& decision) {
    std::string target(request.target());
    if (!isAbsoluteForm(target)) {
        auto host = request.find(boost::beast::http::field::host);
        if (host == request.end() || host->value().empty()) {
            throw GatewayError(ErrorCode::invalid_request, "Request has neither an absolute URL nor a Host header");
        }
        if (target.empty() || target.front() != '/') {
            target.insert(target.begin(), '/');
        }
        request.target("http://" + std::string(host->value()) + target);
    }

    request.erase(boost::beast::http::field::proxy_authorization);
    request.erase("Proxy-Connection");
    if (!decision.upstreamAuthHeader.empty()) {
        request.set(boost::beast::http::field::proxy_authorization, decision.upstreamAuthHeader);
    }
    request.version(kHttpVersion);
    request.keep_alive(false);
    request.prepare_payload();
    return request;
}

} // namespace proxygate::util
