// src/main.cpp
// Startup for PerfPulse. Logs each step so a failed start can be pinpointed.

#include "bounded_queue.hpp"
#include "worker_pool.hpp"
#include "aggregator.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "util_log.hpp"

// implemented in cli.cpp
extern void run_cli(Aggregator &agg, std::atomic<bool> &terminate_flag);

#include <iostream>
#include <thread>
#include <csignal>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <exception>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

std::atomic<bool> g_terminate{false};

void handle_sigint(int) {
    g_terminate.store(true);
}

// only used to precompute the expected Basic auth header
static std::string base64_encode(const std::string &in) {
    static const char *tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 3 <= in.size()) {
        unsigned x = (static_cast<unsigned char>(in[i]) << 16)
                   | (static_cast<unsigned char>(in[i + 1]) << 8)
                   |  static_cast<unsigned char>(in[i + 2]);
        i += 3;
        for (int shift = 18; shift >= 0; shift -= 6) out.push_back(tbl[(x >> shift) & 0x3F]);
    }
    size_t rem = in.size() - i;
    if (rem > 0) {
        unsigned x = static_cast<unsigned char>(in[i]) << 16;
        if (rem == 2) x |= static_cast<unsigned char>(in[i + 1]) << 8;
        out.push_back(tbl[(x >> 18) & 0x3F]);
        out.push_back(tbl[(x >> 12) & 0x3F]);
        out.push_back(rem == 2 ? tbl[(x >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

// tail -f style reader; reopens the file when it shrinks (rotation)
static void producer_read_file_loop(const std::string &path, bool follow, BoundedQueue<std::string> &bq) {
    try {
        std::error_code ec;
        while (!g_terminate.load() && !fs::exists(path, ec)) {
            if (!follow) {
                safe_log("producer: cannot open " + path);
                bq.close();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if (g_terminate.load()) { bq.close(); return; }

        std::ifstream in(path);
        if (!in) {
            safe_log("producer: cannot open " + path);
            bq.close();
            return;
        }

        uintmax_t last_size = fs::file_size(path, ec);
        std::string line;
        while (!g_terminate.load() && std::getline(in, line)) {
            if (!bq.push(std::move(line))) break;
        }

        while (follow && !g_terminate.load()) {
            in.clear();
            bool any = false;
            while (!g_terminate.load() && std::getline(in, line)) {
                any = true;
                if (!bq.push(std::move(line))) break;
            }
            if (any) continue;

            uintmax_t cur_size = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
            if (cur_size < last_size) {
                safe_log("producer: " + path + " truncated or rotated, reopening");
                in.close();
                in.clear();
                in.open(path);
                if (!in) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(500));
                    in.clear();
                    in.open(path);
                }
            }
            last_size = cur_size;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        bq.close();
    } catch (const std::exception &ex) {
        safe_log(std::string("producer_read_file_loop: exception: ") + ex.what());
        g_terminate.store(true);
        bq.close();
    }
}

static void producer_read_stdin_loop(BoundedQueue<std::string> &bq) {
    try {
        std::string line;
        while (!g_terminate.load() && std::getline(std::cin, line)) {
            if (!bq.push(std::move(line))) break;
        }
        bq.close();
    } catch (const std::exception &ex) {
        safe_log(std::string("producer_read_stdin_loop: exception: ") + ex.what());
        g_terminate.store(true);
        bq.close();
    }
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);

    AppConfig cfg;
    try {
        cfg = parse_command_line(argc, argv);
    } catch (const std::invalid_argument &e) {
        safe_log(std::string("configuration error: ") + e.what());
        std::cerr << usage_text();
        return 1;
    }
    if (cfg.show_help) {
        std::cout << usage_text();
        return 0;
    }
    if (cfg.workers == 0) {
        cfg.workers = std::thread::hardware_concurrency();
        if (cfg.workers == 0) cfg.workers = 4;
    }

    {
        std::ostringstream os;
        os << "Starting PerfPulse; file=" << (cfg.file.empty() ? "<stdin>" : cfg.file)
           << " follow=" << (cfg.follow ? "true" : "false")
           << " workers=" << cfg.workers
           << " qcap=" << cfg.qcap
           << " http_enable=" << (cfg.http_enable ? "true" : "false")
           << " http_port=" << cfg.http_port
           << " seed=" << cfg.agg.seed;
        safe_log(os.str());
    }

    // shared with the stdin producer, which may outlive main's scope when detached
    auto queue = std::make_shared<BoundedQueue<std::string>>(cfg.qcap);
    BoundedQueue<std::string> &bq = *queue;

    std::unique_ptr<Aggregator> agg_ptr;
    try {
        safe_log("STEP: constructing Aggregator");
        agg_ptr = std::make_unique<Aggregator>(cfg.agg);
        safe_log("OK: Aggregator constructed");
    } catch (const std::invalid_argument &e) {
        safe_log(std::string("Aggregator configuration rejected: ") + e.what());
        return 1;
    } catch (const std::bad_alloc &ba) {
        safe_log(std::string("Aggregator construction bad_alloc: ") + ba.what());
        return 1;
    }
    Aggregator &agg = *agg_ptr;

    std::thread prod;
    try {
        safe_log("STEP: starting producer thread");
        if (cfg.file.empty()) {
            prod = std::thread([queue]{ producer_read_stdin_loop(*queue); });
        } else {
            prod = std::thread([&]{ producer_read_file_loop(cfg.file, cfg.follow, bq); });
        }
    } catch (const std::system_error &e) {
        safe_log(std::string("producer thread: ") + e.what());
        g_terminate.store(true);
    }

    std::unique_ptr<WorkerPool> wp_ptr;
    try {
        safe_log("STEP: constructing WorkerPool");
        wp_ptr = std::make_unique<WorkerPool>(cfg.workers, bq, agg);
        safe_log("OK: WorkerPool constructed");
    } catch (const std::exception &e) {
        safe_log(std::string("WorkerPool construction exception: ") + e.what());
        g_terminate.store(true);
    }

    std::unique_ptr<HttpServer> http_srv;
    if (cfg.http_enable && !g_terminate.load()) {
        try {
            safe_log("STEP: creating HttpServer");
            std::string auth_expected;
            if (!cfg.http_user.empty() || !cfg.http_pass.empty()) {
                auth_expected = std::string("Basic ") + base64_encode(cfg.http_user + ":" + cfg.http_pass);
            }
            http_srv = std::make_unique<HttpServer>("", static_cast<uint16_t>(cfg.http_port), agg,
                                                    cfg.http_cache_ttl, auth_expected, &bq);
            if (!http_srv->start()) {
                safe_log("HttpServer failed to start");
                http_srv.reset();
            }
        } catch (const std::exception &e) {
            safe_log(std::string("HttpServer exception: ") + e.what());
            http_srv.reset();
        }
    }

    // the console shares stdin with the producer, so it only runs when events come from a file
    try {
        if (!cfg.file.empty()) {
            run_cli(agg, g_terminate);
        } else {
            while (!g_terminate.load() && !bq.closed()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
            // input exhausted; keep serving HTTP until interrupted
            while (!g_terminate.load() && http_srv) std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } catch (const std::exception &e) {
        safe_log(std::string("CLI/loop exception: ") + e.what());
    }

    // close first so workers drain what was already read, then stop the producer
    safe_log("Shutdown: draining queue");
    const bool input_exhausted = bq.closed();
    bq.close();

    if (http_srv) {
        http_srv->stop();
        http_srv.reset();
    }
    wp_ptr.reset(); // joins workers

    g_terminate.store(true);
    if (prod.joinable()) {
        // a stdin reader still blocked in getline cannot be woken
        if (cfg.file.empty() && !input_exhausted) prod.detach();
        else prod.join();
    }

    safe_log("PerfPulse shutting down normally. events=" + std::to_string(agg.get_total())
             + " parse_errors=" + std::to_string(agg.get_errors()));
    return 0;
}
