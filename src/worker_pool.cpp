// src/worker_pool.cpp
// Worker threads pop raw event lines from the bounded queue, parse them and
// feed the aggregator. Failures are reported through safe_log().

#include "worker_pool.hpp"
#include "util_log.hpp"
#include "global_ctl.hpp"
#include "parser.hpp"
#include <optional>
#include <ctime>
#include <exception>

WorkerPool::WorkerPool(size_t num_workers, BoundedQueue<std::string> &queue_, Aggregator &aggregator_)
    : queue(queue_), aggregator(aggregator_)
{
    size_t n = (num_workers == 0) ? 1 : num_workers;
    workers.reserve(n);
    for (size_t i = 0; i < n; ++i) workers.emplace_back(&WorkerPool::run, this);
}

void WorkerPool::run() {
    try {
        std::string line;
        // pop() returns false once the queue is closed and drained
        while (queue.pop(line)) {
            if (line.empty()) continue;
            try {
                auto parsed = parse_event_line(line);
                if (parsed.has_value()) {
                    AthleteEvent &e = *parsed;
                    if (e.ts == 0) e.ts = std::time(nullptr);
                    aggregator.add_event(e);
                } else {
                    aggregator.add_parse_error();
                }
            } catch (const std::exception &pex) {
                safe_log(std::string("Exception while processing event in worker: ") + pex.what());
                aggregator.add_parse_error();
            }
            if (g_terminate.load()) break;
        }
    } catch (const std::exception &ex) {
        safe_log(std::string("Unhandled exception in worker thread: ") + ex.what());
        g_terminate.store(true);
    }
}

WorkerPool::~WorkerPool() {
    // close the queue so blocked workers wake up and drain
    queue.close();

    for (auto &t : workers) {
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::exception &ex) {
                safe_log(std::string("Exception joining worker thread: ") + ex.what());
            }
        }
    }
}
