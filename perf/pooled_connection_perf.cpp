#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "pool_cpp/pool.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_ms = total_ms / iters;
    const double min_ms =
        std::chrono::duration<double, std::milli>(min).count();
    const double max_ms =
        std::chrono::duration<double, std::milli>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << " total_ms=" << std::fixed
              << std::setprecision(2) << total_ms << " avg_ms=" << std::fixed
              << std::setprecision(3) << avg_ms << " min_ms=" << std::fixed
              << std::setprecision(3) << min_ms << " max_ms=" << std::fixed
              << std::setprecision(3) << max_ms << "\n";
}

static void print_throughput(const char* label, int threads,
                             std::uint64_t total_reqs,
                             std::chrono::nanoseconds elapsed,
                             const pool_cpp::PoolMetrics& m) {
    const double secs = std::chrono::duration<double>(elapsed).count();
    const double rps = secs > 0 ? (double)total_reqs / secs : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        threads=" << threads << " total_reqs=" << total_reqs
              << " rps=" << std::fixed << std::setprecision(2) << rps
              << " checkouts=" << m.checkouts.load()
              << " reentrant=" << m.reentrant_checkouts.load()
              << " timeouts=" << m.timeouts.load() << "\n";
}

// Tiny in-process HTTP server (async accept so stop is reliable).
class LocalHttpServer {
   public:
    LocalHttpServer() : ioc_(1), acceptor_(ioc_) {}

    void start() {
        boost::system::error_code ec;

        tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};

        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("acceptor.open: " + ec.message());

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::runtime_error("acceptor.set_option: " + ec.message());

        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("acceptor.bind: " + ec.message());

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("acceptor.listen: " + ec.message());

        port_ = acceptor_.local_endpoint().port();

        do_accept();

        thread_ = std::thread([this] { ioc_.run(); });
    }

    void stop() {
        bool expected = false;
        if (!stopped_.compare_exchange_strong(expected, true)) {
            return;
        }

        boost::system::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
        if (thread_.joinable()) thread_.join();
    }

    ~LocalHttpServer() { stop(); }

    tcp::endpoint endpoint() const {
        return {net::ip::make_address("127.0.0.1"), port_};
    }

   private:
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [this](boost::system::error_code ec, tcp::socket sock) {
                if (!ec) {
                    // One detached thread per connection is plenty for a
                    // perf harness.
                    std::thread(&LocalHttpServer::handle_connection,
                                std::move(sock))
                        .detach();
                }
                if (!stopped_.load(std::memory_order_relaxed)) {
                    do_accept();
                }
            });
    }

    static void handle_connection(tcp::socket sock) {
        beast::tcp_stream stream(std::move(sock));
        beast::flat_buffer buffer;

        for (;;) {
            boost::system::error_code ec;

            http::request<http::string_body> req;
            http::read(stream, buffer, req, ec);
            if (ec) break;

            http::response<http::string_body> res;
            res.version(req.version());
            res.set(http::field::server, "pool_cpp-perf-local");
            res.keep_alive(req.keep_alive());
            res.result(http::status::ok);
            res.set(http::field::content_type, "text/plain");
            res.body() = "OK";
            res.prepare_payload();

            http::write(stream, res, ec);
            if (ec) break;
            if (!res.keep_alive()) break;
        }

        boost::system::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> stopped_{false};
    uint16_t port_{0};
};

class HttpConnection {
   public:
    HttpConnection(net::io_context& ioc, const tcp::endpoint& ep)
        : stream_(ioc) {
        stream_.connect(ep);
    }

    unsigned get(const std::string& target, bool keep_alive = true) {
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(keep_alive);
        http::write(stream_, req);

        http::response<http::string_body> res;
        http::read(stream_, buffer_, res);
        return res.result_int();
    }

   private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
};

class PooledConnectionPerf : public ::testing::Test {
   protected:
    static void SetUpTestSuite() { server_.start(); }

    static void TearDownTestSuite() { server_.stop(); }

    static pool_cpp::PoolConfiguration cfg(std::size_t size) {
        pool_cpp::PoolConfiguration c;
        c.size = size;
        c.timeout = 30s;
        return c;
    }

    static pool_cpp::Pool<HttpConnection>::factory_type factory() {
        return [] {
            return std::make_shared<HttpConnection>(client_ioc_,
                                                    server_.endpoint());
        };
    }

    static inline LocalHttpServer server_{};
    static inline net::io_context client_ioc_{};
};

TEST_F(PooledConnectionPerf, WarmPooledConnectionSingleThread) {
    constexpr int iters = 500;
    pool_cpp::Pool<HttpConnection> pool(cfg(1), factory());

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto status =
            pool.with([](HttpConnection& c) { return c.get("/health"); });
        const auto t1 = clock::now();
        ASSERT_EQ(status, 200u);

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Warm (pooled keep-alive connection)", iters, total, min,
                 max);
}

TEST_F(PooledConnectionPerf, ColdNewConnectionEachRequest) {
    constexpr int iters = 200;

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        HttpConnection conn(client_ioc_, server_.endpoint());
        auto status = conn.get("/health", false);
        const auto t1 = clock::now();
        ASSERT_EQ(status, 200u);

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Cold (new connection each request)", iters, total, min,
                 max);
}

TEST_F(PooledConnectionPerf, ContendedPoolThroughput) {
    constexpr int threads = 16;
    constexpr int per_thread = 200;
    pool_cpp::Pool<HttpConnection> pool(cfg(4), factory());

    std::atomic<std::uint64_t> done{0};
    const auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&] {
            for (int j = 0; j < per_thread; ++j) {
                auto status = pool.with(
                    [](HttpConnection& c) { return c.get("/health"); });
                if (status == 200) ++done;
            }
        });
    }
    for (auto& t : workers) t.join();

    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(done.load(), static_cast<std::uint64_t>(threads * per_thread));

    print_throughput("16 threads sharing 4 pooled connections", threads,
                     done.load(), elapsed, pool.metrics());
}
