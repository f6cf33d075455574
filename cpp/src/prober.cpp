#include "prober.hpp"
#include "probe_session.hpp"

#include <string>

namespace {
    class ProbeCategory : public boost::system::error_category {
    public:
        const char* name() const noexcept override {
            return "probe";
        }

        std::string message(int value) const override {
            switch (static_cast<gate::probe_error>(value)) {
            case gate::probe_error::unhealthy_status:
                return "Endpoint answered with an HTTP error status";
            }
            return "Unknown probe error";
        }
    };
}

namespace gate {

const boost::system::error_category& probe_category() {
    static const ProbeCategory category;
    return category;
}

boost::system::error_code make_error_code(probe_error e) {
    return {static_cast<int>(e), probe_category()};
}

NetworkProber::NetworkProber(asio::io_context& ioc, ssl::context& ssl_ctx, bool verify_peer)
    : ioc_(ioc)
    , ssl_ctx_(ssl_ctx)
    , verify_peer_(verify_peer)
{
}

void NetworkProber::async_probe(const Endpoint& endpoint,
                                std::chrono::milliseconds timeout,
                                Handler handler) {
    auto session = std::make_shared<ProbeSession>(
        ioc_, ssl_ctx_, endpoint, timeout, verify_peer_, std::move(handler));
    current_ = session;
    session->start();
}

void NetworkProber::cancel() {
    if (auto session = current_.lock()) {
        session->cancel();
    }
}

} // namespace gate
