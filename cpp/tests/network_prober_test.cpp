#include <gtest/gtest.h>

#include <boost/asio/ssl.hpp>
#include <cstring>
#include <thread>

#include <dlfcn.h>
#include <netdb.h>

#include "prober.hpp"
#include "readiness_gate.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
namespace ssl = asio::ssl;
using gate::test::local_endpoint;

namespace {
    // Lookups of this name hang like a query to an unreachable DNS server
    constexpr const char* STALLED_HOST = "stalled-dns.invalid";
    constexpr std::chrono::milliseconds STALL{1500};

    gate::Endpoint stalled_endpoint() {
        gate::Endpoint endpoint;
        endpoint.host = STALLED_HOST;
        endpoint.port = 5432;
        return endpoint;
    }

    std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    }
}

// Takes precedence over the C library's getaddrinfo for the whole test binary
extern "C" int getaddrinfo(const char* node, const char* service,
                           const struct addrinfo* hints, struct addrinfo** res) noexcept {
    if (node != nullptr && std::strcmp(node, STALLED_HOST) == 0) {
        std::this_thread::sleep_for(STALL);
        return EAI_AGAIN;
    }
    using getaddrinfo_fn = int (*)(const char*, const char*, const struct addrinfo*, struct addrinfo**);
    static auto next = reinterpret_cast<getaddrinfo_fn>(::dlsym(RTLD_NEXT, "getaddrinfo"));
    if (next == nullptr) {
        return EAI_SYSTEM;
    }
    return next(node, service, hints, res);
}

namespace {
    class NetworkProberTest : public ::testing::Test {
    protected:
        NetworkProberTest()
            : ssl_ctx_(ssl::context::tls_client)
            , prober_(ioc_, ssl_ctx_, false)
        {
        }

        // Runs one probe to completion and returns its result
        boost::system::error_code probe(const gate::Endpoint& endpoint,
                                        std::chrono::milliseconds timeout = 1000ms) {
            boost::system::error_code result = asio::error::would_block;
            prober_.async_probe(endpoint, timeout, [&result](const boost::system::error_code& ec) {
                result = ec;
            });
            ioc_.restart();
            ioc_.run();
            return result;
        }

        asio::io_context ioc_;
        ssl::context ssl_ctx_;
        gate::NetworkProber prober_;
    };
}

TEST_F(NetworkProberTest, TcpProbeSucceedsWhenSomethingListens) {
    tcp::acceptor acceptor(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    auto port = acceptor.local_endpoint().port();

    EXPECT_EQ(probe(local_endpoint(port)), boost::system::error_code());
}

TEST_F(NetworkProberTest, TcpProbeFailsWhenNothingListens) {
    auto ec = probe(local_endpoint(gate::test::closed_port()));
    EXPECT_EQ(ec, asio::error::connection_refused);
}

TEST_F(NetworkProberTest, FailedProbesReleaseTheirSockets) {
    auto port = gate::test::closed_port();
    probe(local_endpoint(port));
    int baseline = gate::test::count_open_fds();
    ASSERT_GT(baseline, 0);

    for (int i = 0; i < 25; ++i) {
        EXPECT_EQ(probe(local_endpoint(port)), asio::error::connection_refused);
    }
    EXPECT_EQ(gate::test::count_open_fds(), baseline);
}

TEST_F(NetworkProberTest, SuccessfulProbesReleaseTheirSockets) {
    tcp::acceptor acceptor(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    auto port = acceptor.local_endpoint().port();
    probe(local_endpoint(port));
    int baseline = gate::test::count_open_fds();

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(probe(local_endpoint(port)), boost::system::error_code());
    }
    EXPECT_EQ(gate::test::count_open_fds(), baseline);
}

TEST_F(NetworkProberTest, HttpProbeAcceptsSuccessStatus) {
    gate::test::OneShotHttpServer server(200);

    EXPECT_EQ(probe(local_endpoint(server.port(), gate::Scheme::Http, "/health")),
              boost::system::error_code());
    server.wait();
    EXPECT_EQ(server.target(), "/health");
    EXPECT_EQ(server.host(), "127.0.0.1:" + std::to_string(server.port()));
}

TEST_F(NetworkProberTest, HttpProbeRejectsErrorStatus) {
    gate::test::OneShotHttpServer server(503);

    auto ec = probe(local_endpoint(server.port(), gate::Scheme::Http, "/health"));
    EXPECT_EQ(ec, gate::probe_error::unhealthy_status);
    EXPECT_EQ(ec.category().name(), std::string("probe"));
}

TEST_F(NetworkProberTest, SilentServerTimesOut) {
    gate::test::OneShotHttpServer server(0);

    auto start = std::chrono::steady_clock::now();
    auto ec = probe(local_endpoint(server.port(), gate::Scheme::Http), 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(ec, asio::error::timed_out);
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(NetworkProberTest, CancelAbortsProbeInFlight) {
    gate::test::OneShotHttpServer server(0);

    asio::steady_timer stopper(ioc_);
    stopper.expires_after(50ms);
    stopper.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            prober_.cancel();
        }
    });

    auto ec = probe(local_endpoint(server.port(), gate::Scheme::Http), 5000ms);
    EXPECT_EQ(ec, asio::error::operation_aborted);
}

TEST(StalledResolve, DeadlineEndsTheAttemptWhileTheLookupHangs) {
    // The context outlives the io_context, which joins the lookup thread
    ssl::context ssl_ctx(ssl::context::tls_client);
    asio::io_context ioc;
    gate::NetworkProber prober(ioc, ssl_ctx, false);

    auto start = std::chrono::steady_clock::now();
    boost::system::error_code result = asio::error::would_block;
    std::chrono::milliseconds completed_after{0};
    prober.async_probe(stalled_endpoint(), 200ms, [&](const boost::system::error_code& ec) {
        result = ec;
        completed_after = since(start);
        ioc.stop();
    });
    ioc.run();

    EXPECT_EQ(result, asio::error::timed_out);
    EXPECT_GE(completed_after, 200ms);
    EXPECT_LT(completed_after, STALL - 500ms);
}

TEST(StalledResolve, CancelEndsTheAttemptWhileTheLookupHangs) {
    ssl::context ssl_ctx(ssl::context::tls_client);
    asio::io_context ioc;
    gate::NetworkProber prober(ioc, ssl_ctx, false);

    asio::steady_timer stopper(ioc);
    stopper.expires_after(50ms);
    stopper.async_wait([&prober](const boost::system::error_code& ec) {
        if (!ec) {
            prober.cancel();
        }
    });

    auto start = std::chrono::steady_clock::now();
    boost::system::error_code result = asio::error::would_block;
    int calls = 0;
    std::chrono::milliseconds completed_after{0};
    prober.async_probe(stalled_endpoint(), 5000ms, [&](const boost::system::error_code& ec) {
        ++calls;
        result = ec;
        completed_after = since(start);
        ioc.stop();
    });
    ioc.run();

    EXPECT_EQ(result, asio::error::operation_aborted);
    EXPECT_LT(completed_after, STALL - 500ms);

    // The lookup finishing later must not report a second time
    ioc.restart();
    ioc.run_for(STALL + 1000ms);
    EXPECT_EQ(calls, 1);
}

TEST(StalledResolve, GateGivesUpWithinTimeoutPlusInterval) {
    ssl::context ssl_ctx(ssl::context::tls_client);
    asio::io_context ioc;
    gate::NetworkProber prober(ioc, ssl_ctx, false);
    gate::ReadinessGate gate(ioc, prober);

    gate::RetryPolicy policy;
    policy.interval = 100ms;
    policy.timeout = 300ms;
    policy.connect_timeout = 1000ms;

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(gate.wait_for(stalled_endpoint(), policy), gate::GateOutcome::TimedOut);
    auto elapsed = since(start);

    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 300ms + 100ms + 300ms);
}

TEST_F(NetworkProberTest, HttpsSucceedsWithoutVerification) {
    gate::test::SelfSignedCertificate certificate("localhost");
    gate::test::OneShotHttpsServer server(certificate, 200);

    EXPECT_EQ(probe(local_endpoint(server.port(), gate::Scheme::Https, "/health")),
              boost::system::error_code());
    server.wait();
    EXPECT_EQ(server.target(), "/health");
}

TEST_F(NetworkProberTest, HttpsErrorStatusIsUnhealthy) {
    gate::test::SelfSignedCertificate certificate("localhost");
    gate::test::OneShotHttpsServer server(certificate, 500);

    EXPECT_EQ(probe(local_endpoint(server.port(), gate::Scheme::Https)),
              gate::probe_error::unhealthy_status);
}

TEST(HttpsVerification, UntrustedCertificateIsRejected) {
    gate::test::SelfSignedCertificate certificate("localhost");
    gate::test::OneShotHttpsServer server(certificate, 200);

    ssl::context ssl_ctx(ssl::context::tls_client);
    ssl_ctx.set_verify_mode(ssl::verify_peer);
    asio::io_context ioc;
    gate::NetworkProber prober(ioc, ssl_ctx, true);

    boost::system::error_code result = asio::error::would_block;
    prober.async_probe(local_endpoint(server.port(), gate::Scheme::Https), 2000ms,
                       [&result](const boost::system::error_code& ec) { result = ec; });
    ioc.run();

    EXPECT_NE(result, boost::system::error_code());
    EXPECT_NE(result, asio::error::timed_out);
    EXPECT_STREQ(result.category().name(), asio::error::get_ssl_category().name());
    server.wait();
    EXPECT_TRUE(server.target().empty());
}

TEST(HttpsVerification, TrustedCertificateMatchingTheHostIsAccepted) {
    gate::test::SelfSignedCertificate certificate("localhost");
    gate::test::OneShotHttpsServer server(certificate, 200);

    ssl::context ssl_ctx(ssl::context::tls_client);
    ssl_ctx.set_verify_mode(ssl::verify_peer);
    certificate.trust(ssl_ctx);
    asio::io_context ioc;
    gate::NetworkProber prober(ioc, ssl_ctx, true);

    gate::Endpoint endpoint = local_endpoint(server.port(), gate::Scheme::Https, "/ready");
    endpoint.host = "localhost";

    boost::system::error_code result = asio::error::would_block;
    prober.async_probe(endpoint, 2000ms,
                       [&result](const boost::system::error_code& ec) { result = ec; });
    ioc.run();

    EXPECT_EQ(result, boost::system::error_code()) << result.message();
    server.wait();
    EXPECT_EQ(server.server_name(), "localhost");
    EXPECT_EQ(server.target(), "/ready");
}

TEST(HttpsVerification, TrustedCertificateForAnotherHostIsRejected) {
    gate::test::SelfSignedCertificate certificate("localhost");
    gate::test::OneShotHttpsServer server(certificate, 200);

    ssl::context ssl_ctx(ssl::context::tls_client);
    ssl_ctx.set_verify_mode(ssl::verify_peer);
    certificate.trust(ssl_ctx);
    asio::io_context ioc;
    gate::NetworkProber prober(ioc, ssl_ctx, true);

    // The certificate names localhost, not the address
    boost::system::error_code result = asio::error::would_block;
    prober.async_probe(local_endpoint(server.port(), gate::Scheme::Https), 2000ms,
                       [&result](const boost::system::error_code& ec) { result = ec; });
    ioc.run();

    EXPECT_STREQ(result.category().name(), asio::error::get_ssl_category().name());
    server.wait();
    EXPECT_TRUE(server.target().empty());
}
