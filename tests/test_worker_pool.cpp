// tests/test_worker_pool.cpp
// Pushes event lines through the queue and checks they reach the aggregator.

#include <iostream>
#include <string>
#include <vector>
#include <ctime>

#include "../src/bounded_queue.hpp"
#include "../src/aggregator.hpp"
#include "../src/worker_pool.hpp"

int main() {
    BoundedQueue<std::string> bq(1024);
    Aggregator agg;

    std::vector<std::string> lines = {
        "ts=100 player=ana sport=tennis play=serve speed=\"20 m/s\" accuracy=70% stamina=90 peak=1 prev=good state=peak",
        "ts=101 player=ana sport=tennis play=serve speed=18 accuracy=65 stamina=85 peak=0 prev=peak state=good",
        "ts=102 player=ben sport=tennis play=volley speed=9.5 accuracy=80 stamina=60",
        "garbage that is not an event",
        "",
    };

    {
        WorkerPool wp(2, bq, agg);
        for (auto &ln : lines) {
            bq.push(std::move(ln));
        }
        // destructor closes the queue and joins once it is drained
    }

    if (agg.get_total() != 3) {
        std::cerr << "worker_pool: expected 3 events got " << agg.get_total() << "\n";
        return 2;
    }
    if (agg.get_errors() != 1) {
        std::cerr << "worker_pool: expected 1 parse error got " << agg.get_errors() << "\n";
        return 3;
    }
    if (agg.approx_player_count("ana") < 2 || !agg.player_summary("ben")) {
        std::cerr << "worker_pool: events not routed to per-player state\n";
        return 4;
    }
    if (agg.peaks_in_window(102) != 1) {
        std::cerr << "worker_pool: peak window mismatch\n";
        return 5;
    }

    // a line without ts is stamped with the wall clock
    BoundedQueue<std::string> bq2(8);
    Aggregator agg2;
    {
        WorkerPool wp(1, bq2, agg2);
        bq2.push("player=cy speed=5 peak=1");
    }
    if (agg2.peaks_in_window(std::time(nullptr)) != 1) {
        std::cerr << "worker_pool: unstamped event missing from the current window\n";
        return 6;
    }

    std::cout << "test_worker_pool: OK\n";
    return 0;
}
