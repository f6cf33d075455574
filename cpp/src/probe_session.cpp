#include "probe_session.hpp"
#include "prober.hpp"
#include "version.hpp"

#include <iostream>

namespace gate {

ProbeSession::ProbeSession(
    asio::io_context& ioc,
    ssl::context& ssl_ctx,
    const Endpoint& endpoint,
    std::chrono::milliseconds timeout,
    bool verify_peer,
    Handler handler
)
    : endpoint_(endpoint)
    , timeout_(timeout)
    , verify_peer_(verify_peer)
    , handler_(std::move(handler))
    , resolver_(ioc)
    , stream_(ioc, ssl_ctx)
    , deadline_(ioc)
    , status_(0)
    , done_(false)
    , timed_out_(false)
    , cancelled_(false)
{
}

void ProbeSession::start() {
    // One deadline covers resolution, connect and the HTTP exchange
    deadline_.expires_after(timeout_);
    deadline_.async_wait([self = shared_from_this()](const beast::error_code& ec) {
        self->on_deadline(ec);
    });
    resolve();
}

void ProbeSession::cancel() {
    if (done_) {
        return;
    }
    cancelled_ = true;
    resolver_.cancel();
    beast::get_lowest_layer(stream_).close();
    // A resolve blocked in getaddrinfo ignores cancel(), so finish here
    asio::post(deadline_.get_executor(), [self = shared_from_this()]() {
        self->complete(asio::error::operation_aborted);
    });
}

void ProbeSession::on_deadline(const beast::error_code& ec) {
    if (ec || done_) {
        return;
    }
    timed_out_ = true;
    complete(asio::error::timed_out);
}

void ProbeSession::resolve() {
    resolver_.async_resolve(
        endpoint_.host,
        endpoint_.port_string(),
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                self->complete(ec);
                return;
            }
            self->connect(results);
        }
    );
}

void ProbeSession::connect(const tcp::resolver::results_type& results) {
    beast::get_lowest_layer(stream_).async_connect(
        results,
        [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
            if (ec) {
                self->complete(ec);
                return;
            }
            switch (self->endpoint_.scheme) {
            case Scheme::Tcp:
                self->complete({});
                break;
            case Scheme::Http:
                self->send_request(beast::get_lowest_layer(self->stream_));
                break;
            case Scheme::Https:
                self->ssl_handshake();
                break;
            }
        }
    );
}

void ProbeSession::ssl_handshake() {
    // Set SNI hostname
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), endpoint_.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        complete(ec);
        return;
    }
    if (verify_peer_) {
        stream_.set_verify_callback(ssl::host_name_verification(endpoint_.host));
    }

    stream_.async_handshake(
        ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                self->complete(ec);
                return;
            }
            self->send_request(self->stream_);
        }
    );
}

template <class Stream>
void ProbeSession::send_request(Stream& stream) {
    request_.version(11);
    request_.method(http::verb::get);
    request_.target(endpoint_.path);
    request_.set(http::field::host, endpoint_.host_header());
    request_.set(http::field::user_agent, std::string("launchgate/") + VERSION);
    request_.set(http::field::connection, "close");

    http::async_write(
        stream,
        request_,
        [self = shared_from_this(), &stream](beast::error_code ec, std::size_t) {
            if (ec) {
                self->complete(ec);
                return;
            }
            self->read_response(stream);
        }
    );
}

template <class Stream>
void ProbeSession::read_response(Stream& stream) {
    // Only the status line matters, the body is never read
    http::async_read_header(
        stream,
        buffer_,
        parser_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                self->complete(ec);
                return;
            }
            self->status_ = self->parser_.get().result_int();
            if (self->status_ >= 400) {
                std::cout << "[Probe] " << self->endpoint_.to_string()
                          << " answered HTTP " << self->status_ << std::endl;
                self->complete(probe_error::unhealthy_status);
                return;
            }
            self->complete({});
        }
    );
}

void ProbeSession::complete(beast::error_code ec) {
    if (done_) {
        return;
    }
    done_ = true;

    if (ec && timed_out_) {
        ec = asio::error::timed_out;
    } else if (ec && cancelled_) {
        ec = asio::error::operation_aborted;
    }

    deadline_.cancel();
    resolver_.cancel();

    beast::error_code ignored;
    auto& socket = beast::get_lowest_layer(stream_).socket();
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) {
        handler(ec);
    }
}

} // namespace gate
