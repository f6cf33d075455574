#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <type_traits>

#include "endpoint.hpp"

namespace asio = boost::asio;
namespace ssl = asio::ssl;

namespace gate {

// Failures a probe reports on top of the Asio/Beast error codes
enum class probe_error {
    unhealthy_status = 1   // HTTP status >= 400
};

const boost::system::error_category& probe_category();
boost::system::error_code make_error_code(probe_error e);

// One readiness check against an endpoint, each on its own connection
class Prober {
public:
    using Handler = std::function<void(const boost::system::error_code&)>;

    virtual ~Prober() = default;

    // Starts a probe; the handler runs on the io_context once it completes,
    // fails, times out or is cancelled.
    virtual void async_probe(const Endpoint& endpoint,
                             std::chrono::milliseconds timeout,
                             Handler handler) = 0;

    // Aborts the probe in flight; its handler sees operation_aborted
    virtual void cancel() = 0;
};

class ProbeSession;

// TCP connect for tcp endpoints, GET request for http and https endpoints
class NetworkProber : public Prober {
public:
    NetworkProber(asio::io_context& ioc, ssl::context& ssl_ctx, bool verify_peer);

    void async_probe(const Endpoint& endpoint,
                     std::chrono::milliseconds timeout,
                     Handler handler) override;
    void cancel() override;

private:
    asio::io_context& ioc_;
    ssl::context& ssl_ctx_;
    bool verify_peer_;
    std::weak_ptr<ProbeSession> current_;
};

} // namespace gate

namespace boost {
namespace system {

template <>
struct is_error_code_enum<gate::probe_error> : std::true_type {};

} // namespace system
} // namespace boost
