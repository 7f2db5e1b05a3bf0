#pragma once
#include <string>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include "aggregator.hpp"
#include "bounded_queue.hpp"

// Read-only HTTP/1.1 front end over the aggregator. One thread accepts,
// each connection is served on a detached thread. /stats and /metrics are
// rebuilt at most once per cache TTL.
class HttpServer {
public:
    HttpServer(const std::string &bind_addr,
               uint16_t port,
               Aggregator &agg_ref,
               unsigned cache_ttl_seconds = 1,
               const std::string &auth_expected = "",
               const BoundedQueue<std::string> *queue = nullptr);
    ~HttpServer();

    bool start();
    void stop();

    void rebuild_cache_now();

    // Route one request target ("/path?query") to a status code and body.
    // Exposed so the routing can be exercised without sockets.
    int route(const std::string &target, std::string &body, std::string &content_type);

private:
    void accept_loop();
    void handle_connection(int sock_fd);

    std::string build_stats_json() const;
    std::string build_metrics_text() const;

    std::string bind_addr_;
    uint16_t port_;
    Aggregator &agg_;
    std::chrono::seconds cache_ttl_;
    std::string auth_expected_header_;
    const BoundedQueue<std::string> *queue_;

    int listen_sock_;
    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::mutex lifecycle_mu_;

    std::mutex cache_mu_;
    std::string cached_stats_;
    std::string cached_metrics_;
    std::chrono::steady_clock::time_point cached_at_;

    std::thread refresher_thread_;
    std::atomic<bool> refresher_running_{false};
};
