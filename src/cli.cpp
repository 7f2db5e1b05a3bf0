#include "aggregator.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <atomic>
#include <string>
#include <unordered_map>

// Optional trailing count, clamped to `cap`. Leaves `value` alone when the
// token is absent; returns false when it is present but not a count.
static bool read_optional(std::istream &in, size_t &value, size_t cap) {
    std::string tok;
    if (!(in >> tok)) return true;
    if (tok.empty() || !std::all_of(tok.begin(), tok.end(), [](unsigned char c){ return std::isdigit(c); }))
        return false;
    errno = 0;
    unsigned long long v = std::strtoull(tok.c_str(), nullptr, 10);
    value = (errno == ERANGE || v > cap) ? cap : static_cast<size_t>(v);
    return true;
}

static void print_moments(const char *label, const MomentsSnapshot &m) {
    std::cout << "  " << label << ": n=" << m.n
              << " mean=" << m.mean
              << " var=" << m.variance
              << " skew=" << m.skewness
              << " kurt=" << m.kurtosis << "\n";
}

static void print_distribution(const StateDistribution &d) {
    for (auto &p : d) std::cout << "  " << std::left << std::setw(12) << p.first << std::right
                                << std::fixed << std::setprecision(4) << p.second << "\n";
    std::cout << std::defaultfloat << std::setprecision(6);
}

// Rewards used by STRATEGY when none are given: evenly spaced from 1 for the
// first configured state down to 0 for the last.
static std::unordered_map<std::string,double> default_rewards(const std::vector<std::string> &states) {
    std::unordered_map<std::string,double> r;
    for (size_t i = 0; i < states.size(); ++i) {
        r[states[i]] = states.size() == 1 ? 1.0
                     : 1.0 - static_cast<double>(i) / static_cast<double>(states.size() - 1);
    }
    return r;
}

void run_cli(Aggregator &agg, std::atomic<bool> &terminate_flag) {
    std::string cmd;
    std::cout << "PerfPulse CLI ready. Commands: STATS | TOP [K] | APPROX player | SEEN sport play | SAMPLE"
                 " | MOMENTS player | SIMILAR player [k] | MARKOV | PREDICT state [steps] | STRATEGY rest|none [state=reward ...]"
                 " | SIMULATE speed accuracy stamina [trials] | QUIT\n> " << std::flush;

    while (!terminate_flag.load() && std::getline(std::cin, cmd)) {
        if (cmd.empty()) {
            std::cout << "> " << std::flush;
            continue;
        }

        std::stringstream ss(cmd);
        std::string tok;
        ss >> tok;

        if (tok == "STATS") {
            std::cout << "events: " << agg.get_total()
                      << "  parse_errors: " << agg.get_errors()
                      << "  new_play_types: " << agg.get_new_play_types() << "\n"
                      << "distinct plays ~" << std::fixed << std::setprecision(0) << agg.distinct_plays_estimate()
                      << std::defaultfloat << std::setprecision(6)
                      << "  players tracked: " << agg.tracked_players() << "\n"
                      << "peaks in last " << agg.config().window_seconds << "s of event time: "
                      << agg.peaks_in_window(agg.latest_event_ts())
                      << "  speed F2 ~" << agg.speed_f2() << "\n";
        }
        else if (tok == "TOP") {
            size_t K = 10;
            if (!read_optional(ss, K, 10'000)) {
                std::cout << "Usage: TOP [K]\n";
            } else {
                auto t = agg.top_players(K);
                std::cout << "TOP " << t.size() << " players (SpaceSaving):\n";
                for (auto &p : t) std::cout << p.first << " ~" << p.second << "\n";
            }
        }
        else if (tok == "APPROX") {
            std::string player;
            if (ss >> player) std::cout << "approx_count(" << player << ") <= " << agg.approx_player_count(player) << "\n";
            else std::cout << "Usage: APPROX <player>\n";
        }
        else if (tok == "SEEN") {
            std::string sport, play;
            if (ss >> sport >> play) {
                std::cout << sport << ":" << play << (agg.play_type_seen(sport, play) ? " probably seen\n" : " never seen\n");
            } else {
                std::cout << "Usage: SEEN <sport> <play>\n";
            }
        }
        else if (tok == "SAMPLE") {
            auto s = agg.peak_sample();
            std::cout << s.size() << " sampled peak events:\n";
            for (auto &line : s) std::cout << "  " << line << "\n";
        }
        else if (tok == "MOMENTS") {
            std::string player;
            if (!(ss >> player)) {
                std::cout << "Usage: MOMENTS <player>\n";
            } else if (auto s = agg.player_summary(player)) {
                std::cout << player << " (~" << s->approx_events << " events)\n";
                print_moments("speed", s->speed);
                print_moments("accuracy", s->accuracy);
                print_moments("stamina", s->stamina);
            } else {
                std::cout << "no data for " << player << "\n";
            }
        }
        else if (tok == "SIMILAR") {
            std::string player;
            size_t k = 5;
            if (!(ss >> player) || !read_optional(ss, k, 100)) {
                std::cout << "Usage: SIMILAR <player> [k]\n";
            } else if (auto nearest = agg.similar_players(player, k)) {
                std::cout << nearest->size() << " players closest to " << player << ":\n";
                for (auto &n : *nearest) std::cout << "  " << std::left << std::setw(12) << n.player << std::right
                                                << " d=" << n.distance << "\n";
            } else {
                std::cout << "no data for " << player << "\n";
            }
        }
        else if (tok == "MARKOV") {
            MarkovSummary m = agg.markov_summary();
            std::cout << "transition matrix:\n" << std::fixed << std::setprecision(3);
            std::cout << std::setw(12) << "";
            for (auto &s : m.states) std::cout << std::setw(11) << s;
            std::cout << "\n";
            for (size_t i = 0; i < m.matrix.size(); ++i) {
                std::cout << std::left << std::setw(12) << m.states[i] << std::right;
                for (double p : m.matrix[i]) std::cout << std::setw(11) << p;
                std::cout << "\n";
            }
            std::cout << std::defaultfloat << std::setprecision(6);
            std::cout << "stationary (" << m.stationary.iterations << " iterations"
                      << (m.stationary.converged ? "" : ", not converged") << "):\n";
            print_distribution(m.stationary.distribution);
            std::cout << "aperiodic: " << (m.aperiodic ? "yes" : "no")
                      << "  irreducible: " << (m.irreducible ? "yes" : "no")
                      << "  mixing time: " << m.mixing_time << "\n";
        }
        else if (tok == "PREDICT") {
            std::string state;
            size_t steps = 1;
            if (!(ss >> state)) {
                std::cout << "Usage: PREDICT <state> [steps]\n";
            } else {
                if (!read_optional(ss, steps, MAX_PREDICT_STEPS)) {
                    std::cout << "Usage: PREDICT <state> [steps]\n";
                } else if (auto d = agg.predict_state(state, steps)) {
                    std::cout << "distribution after " << steps << " step(s) from " << state << ":\n";
                    print_distribution(*d);
                } else {
                    std::cout << "unknown state " << state << "\n";
                }
            }
        }
        else if (tok == "STRATEGY") {
            std::string action;
            ss >> action;
            auto rewards = default_rewards(agg.config().states);
            std::string kv;
            bool bad = false;
            while (ss >> kv) {
                size_t eq = kv.find('=');
                if (eq == std::string::npos) { bad = true; break; }
                try {
                    rewards[kv.substr(0, eq)] = std::stod(kv.substr(eq + 1));
                } catch (const std::exception &) {
                    bad = true;
                    break;
                }
            }
            if (bad || action.empty()) {
                std::cout << "Usage: STRATEGY rest|none [state=reward ...]\n";
            } else if (auto ev = agg.evaluate_strategy(action, rewards)) {
                std::cout << "action " << action << ": long-term expected reward "
                          << std::fixed << std::setprecision(4) << ev->expected_reward << "\n";
                print_distribution(ev->stationary);
            } else {
                std::cout << "cannot evaluate action " << action << "\n";
            }
        }
        else if (tok == "SIMULATE") {
            double speed, accuracy, stamina;
            size_t trials = 0;
            if ((ss >> speed >> accuracy >> stamina) && read_optional(ss, trials, MAX_SIM_TRIALS)) {
                double p = agg.simulate(speed, accuracy, stamina, trials);
                std::cout << "success probability ~" << std::fixed << std::setprecision(3) << p
                          << std::defaultfloat << std::setprecision(6)
                          << " over " << (trials ? trials : agg.config().mc_trials) << " trials\n";
            } else {
                std::cout << "Usage: SIMULATE <speed m/s> <accuracy %> <stamina %> [trials]\n";
            }
        }
        else if (tok == "QUIT" || tok == "EXIT") {
            terminate_flag.store(true);
            break;
        }
        else {
            std::cout << "Unknown command\n";
        }

        std::cout << "> " << std::flush;
    }

    terminate_flag.store(true);
}
