// tests/test_cli.cpp
// Drives the console loop through redirected stdin/stdout.

#include <iostream>
#include <sstream>
#include <string>
#include <atomic>
#include "../src/aggregator.hpp"

extern void run_cli(Aggregator &agg, std::atomic<bool> &terminate_flag);

static std::string run_script(Aggregator &agg, const std::string &script) {
    std::istringstream in(script);
    std::ostringstream out;
    std::streambuf *old_in = std::cin.rdbuf(in.rdbuf());
    std::streambuf *old_out = std::cout.rdbuf(out.rdbuf());
    std::atomic<bool> stop{false};
    run_cli(agg, stop);
    std::cin.rdbuf(old_in);
    std::cout.rdbuf(old_out);
    return out.str();
}

static bool has(const std::string &body, const std::string &needle) {
    return body.find(needle) != std::string::npos;
}

int main() {
    Aggregator agg;
    const char *names[] = {"ana", "ben", "cal"};
    for (int i = 0; i < 30; i++) {
        AthleteEvent e;
        e.player = names[i % 3];
        e.sport = "tennis";
        e.play_type = "serve";
        e.speed = 10.0 + (i % 3) * 4.0;
        e.accuracy = 60.0 + (i % 3);
        e.stamina = 75.0;
        e.peak = (i % 10) == 0;
        e.prev_state = "good";
        e.state = "peak";
        e.ts = 2000 + i;
        agg.add_event(e);
    }

    std::string out = run_script(agg,
        "PREDICT good -5\n"
        "PREDICT good 5000\n"
        "SIMULATE 12 70 70 -1\n"
        "SIMULATE 12 70 70 99999999999999999999\n"
        "SIMILAR ana 1\n"
        "SIMILAR zed\n"
        "MOMENTS cal\n"
        "STATS\n"
        "QUIT\n");

    if (!has(out, "Usage: PREDICT <state> [steps]")) {
        std::cerr << "cli: negative step count accepted\n" << out;
        return 1;
    }
    if (!has(out, "distribution after 1000 step(s) from good")) {
        std::cerr << "cli: PREDICT steps not capped\n" << out;
        return 2;
    }
    if (!has(out, "Usage: SIMULATE") || !has(out, "over 100000 trials")) {
        std::cerr << "cli: SIMULATE trials not validated or capped\n" << out;
        return 3;
    }
    if (!has(out, "1 players closest to ana:\n  ben") || !has(out, "no data for zed")) {
        std::cerr << "cli: SIMILAR output wrong\n" << out;
        return 4;
    }
    if (!has(out, "  stamina: n=10")) {
        std::cerr << "cli: MOMENTS missing stamina\n" << out;
        return 5;
    }
    // window is read at the newest event time, not the wall clock
    if (!has(out, "s of event time: 2 ")) {
        std::cerr << "cli: peaks window not anchored at latest event\n" << out;
        return 6;
    }

    std::cout << "test_cli: OK\n";
    return 0;
}
