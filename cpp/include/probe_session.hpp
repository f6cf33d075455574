#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>

#include "endpoint.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace gate {

// A single probe: resolve, connect, and for http(s) one GET request.
// The socket is closed as soon as the probe completes, whatever the outcome.
class ProbeSession : public std::enable_shared_from_this<ProbeSession> {
public:
    using Handler = std::function<void(const beast::error_code&)>;

    ProbeSession(
        asio::io_context& ioc,
        ssl::context& ssl_ctx,
        const Endpoint& endpoint,
        std::chrono::milliseconds timeout,
        bool verify_peer,
        Handler handler
    );

    void start();
    void cancel();

    // Status of the HTTP response, 0 until one was read
    unsigned status() const { return status_; }

private:
    void resolve();
    void connect(const tcp::resolver::results_type& results);
    void ssl_handshake();
    template <class Stream> void send_request(Stream& stream);
    template <class Stream> void read_response(Stream& stream);
    void on_deadline(const beast::error_code& ec);
    void complete(beast::error_code ec);

    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
    bool verify_peer_;
    Handler handler_;

    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    asio::steady_timer deadline_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response_parser<http::string_body> parser_;

    unsigned status_;
    bool done_;
    bool timed_out_;
    bool cancelled_;
};

} // namespace gate
