#include "aggregator.hpp"
#include "parser.hpp"
#include "util_log.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <mutex>
#include <stdexcept>

static const size_t MAX_TOPK = 10'000;
static const size_t MAX_SHARDS = 256;

static inline size_t shard_index_for_key(const std::string &key, size_t shard_count) {
    return (shard_count == 0) ? 0 : (std::hash<std::string>{}(key) % shard_count);
}

static MomentsSnapshot snapshot(const RunningMoments &m) {
    MomentsSnapshot s;
    s.n = m.count();
    s.mean = m.mean();
    s.variance = m.variance();
    s.skewness = m.skewness();
    s.kurtosis = m.kurtosis();
    return s;
}

// Every component gets its own seed derived from cfg.seed so no two of them
// share hash functions.
Aggregator::Aggregator(const AggregatorConfig &cfg)
    : cfg_(cfg),
      play_filter(cfg.bloom_capacity, cfg.bloom_error_rate, cfg.seed ^ 0xB10011ULL),
      distinct_plays(cfg.hll_precision, cfg.seed ^ 0x4C4C4ULL),
      player_cms(cfg.cms_width, cfg.cms_depth, cfg.seed ^ 0xC0FFEEULL),
      top_players_ss(cfg.topk_capacity),
      peak_sampler(cfg.sample_k, cfg.seed ^ 0x5A3F1EULL),
      peak_window(cfg.window_seconds),
      speed_ams(cfg.ams_k, cfg.seed ^ 0xA35F2ULL),
      player_shard_count(std::min(std::max<size_t>(cfg.player_shards, 1), MAX_SHARDS)),
      player_shard_mus(player_shard_count),
      player_shards(player_shard_count),
      markov(cfg.states, cfg.smoothing),
      simulator(cfg.mc_trials, cfg.seed ^ 0x3C4A7ULL)
{
    safe_log(std::string("Aggregator ctor: bloom_capacity=") + std::to_string(cfg.bloom_capacity)
             + " bloom_bits=" + std::to_string(play_filter.bit_count())
             + " bloom_hashes=" + std::to_string(play_filter.hash_count())
             + " cms=" + std::to_string(cfg.cms_width) + "x" + std::to_string(cfg.cms_depth)
             + " sample_k=" + std::to_string(cfg.sample_k)
             + " window_s=" + std::to_string(cfg.window_seconds)
             + " ams_k=" + std::to_string(cfg.ams_k)
             + " states=" + std::to_string(cfg.states.size())
             + " player_shards=" + std::to_string(player_shard_count));
}

// route one event through every component
void Aggregator::add_event(const AthleteEvent &e) {
    // floor(speed) feeds an int64 key below
    if (!(e.speed >= 0.0 && e.speed <= MAX_EVENT_SPEED)) {
        parse_errors.fetch_add(1);
        safe_log("add_event: rejected speed " + std::to_string(e.speed) + " for player " + e.player);
        return;
    }
    total_events.fetch_add(1, std::memory_order_relaxed);

    const std::string play_key = e.sport + ":" + e.play_type;
    {
        std::unique_lock<std::shared_mutex> lk(bloom_mu);
        if (!play_filter.contains(play_key)) {
            play_filter.insert(play_key);
            new_play_types.fetch_add(1, std::memory_order_relaxed);
            safe_log("first time analyzing play type: " + play_key);
        }
    }

    {
        std::unique_lock<std::shared_mutex> lk(hll_mu);
        distinct_plays.add(e.sport + "|" + e.play_type + "|" + e.player);
    }

    {
        std::unique_lock<std::shared_mutex> lk(cms_mu);
        player_cms.add(e.player, 1);
    }

    {
        std::unique_lock<std::shared_mutex> lk(ss_mu);
        top_players_ss.update(e.player, 1);
    }

    if (e.peak) {
        std::string serialized = format_event_line(e);
        std::unique_lock<std::shared_mutex> lk(sampler_mu);
        peak_sampler.consider(serialized);
    }

    {
        size_t idx = shard_index_for_key(e.player, player_shard_count);
        std::unique_lock<std::shared_mutex> lk(player_shard_mus[idx]);
        PlayerStats &ps = player_shards[idx][e.player];
        ps.speed.update(e.speed);
        ps.accuracy.update(e.accuracy);
        ps.stamina.update(e.stamina);
    }

    {
        std::unique_lock<std::shared_mutex> lk(ams_mu);
        speed_ams.update(static_cast<int64_t>(std::floor(e.speed)), 1);
    }

    {
        // parallel workers may deliver slightly out of order; the histogram
        // needs non-decreasing timestamps
        std::unique_lock<std::shared_mutex> lk(window_mu);
        window_last_ts = std::max(window_last_ts, e.ts);
        peak_window.add_bit(e.peak, window_last_ts);
    }

    if (!e.prev_state.empty() && !e.state.empty()) {
        std::unique_lock<std::shared_mutex> lk(markov_mu);
        markov.observe_transition(e.prev_state, e.state);
    }
}

void Aggregator::add_parse_error(){ parse_errors.fetch_add(1); }
uint64_t Aggregator::get_total() const noexcept { return total_events.load(); }
uint64_t Aggregator::get_errors() const noexcept { return parse_errors.load(); }
uint64_t Aggregator::get_new_play_types() const noexcept { return new_play_types.load(); }

bool Aggregator::play_type_seen(const std::string &sport, const std::string &play) const noexcept {
    try {
        std::shared_lock<std::shared_mutex> lk(bloom_mu);
        return play_filter.contains(sport + ":" + play);
    } catch (const std::exception &e) {
        safe_log(std::string("play_type_seen: exception: ") + e.what());
        return false;
    }
}

double Aggregator::distinct_plays_estimate() const noexcept {
    std::shared_lock<std::shared_mutex> lk(hll_mu);
    return distinct_plays.estimate();
}

uint64_t Aggregator::approx_player_count(const std::string &player) const noexcept {
    std::shared_lock<std::shared_mutex> lk(cms_mu);
    return player_cms.estimate(player);
}

std::vector<std::pair<std::string,uint64_t>> Aggregator::top_players(size_t K) const noexcept {
    try {
        if (K == 0) K = 10;
        if (K > MAX_TOPK) K = MAX_TOPK;
        std::shared_lock<std::shared_mutex> lk(ss_mu);
        return top_players_ss.topk(K);
    } catch (const std::exception &e) {
        safe_log(std::string("top_players: exception: ") + e.what());
        return {};
    }
}

std::vector<std::string> Aggregator::peak_sample() const noexcept {
    try {
        std::shared_lock<std::shared_mutex> lk(sampler_mu);
        return peak_sampler.sample();
    } catch (const std::exception &e) {
        safe_log(std::string("peak_sample: exception: ") + e.what());
        return {};
    }
}

uint64_t Aggregator::peaks_in_window(std::time_t now) const noexcept {
    std::shared_lock<std::shared_mutex> lk(window_mu);
    return peak_window.query(now);
}

std::time_t Aggregator::latest_event_ts() const noexcept {
    std::shared_lock<std::shared_mutex> lk(window_mu);
    return window_last_ts;
}

double Aggregator::speed_f2() const noexcept {
    std::shared_lock<std::shared_mutex> lk(ams_mu);
    return speed_ams.estimate();
}

std::optional<PlayerSummary> Aggregator::player_summary(const std::string &player) const noexcept {
    PlayerSummary out;
    {
        size_t idx = shard_index_for_key(player, player_shard_count);
        std::shared_lock<std::shared_mutex> lk(player_shard_mus[idx]);
        auto it = player_shards[idx].find(player);
        if (it == player_shards[idx].end()) return std::nullopt;
        out.speed = snapshot(it->second.speed);
        out.accuracy = snapshot(it->second.accuracy);
        out.stamina = snapshot(it->second.stamina);
    }
    out.approx_events = approx_player_count(player);
    return out;
}

size_t Aggregator::tracked_players() const noexcept {
    size_t total = 0;
    for (size_t s = 0; s < player_shard_count; ++s) {
        std::shared_lock<std::shared_mutex> lk(player_shard_mus[s]);
        total += player_shards[s].size();
    }
    return total;
}

// O(states^3) in the worst case; callers poll it, not per event
MarkovSummary Aggregator::markov_summary() const noexcept {
    MarkovSummary out;
    try {
        std::shared_lock<std::shared_mutex> lk(markov_mu);
        out.states = markov.states();
        out.matrix = markov.transition_matrix();
        out.stationary = markov.stationary_distribution();
        out.aperiodic = markov.is_aperiodic();
        out.irreducible = markov.is_irreducible();
        out.mixing_time = markov.mixing_time_approx();
    } catch (const std::exception &e) {
        safe_log(std::string("markov_summary: exception: ") + e.what());
    }
    return out;
}

std::optional<StateDistribution> Aggregator::predict_state(const std::string &state, size_t steps) const noexcept {
    try {
        std::shared_lock<std::shared_mutex> lk(markov_mu);
        return markov.predict_distribution(state, steps);
    } catch (const std::exception &e) {
        safe_log(std::string("predict_state: exception: ") + e.what());
        return std::nullopt;
    }
}

std::optional<ActionEvaluation> Aggregator::evaluate_strategy(const std::string &action,
                                                              const std::unordered_map<std::string,double> &rewards) const noexcept {
    try {
        Matrix P;
        std::vector<std::string> states;
        {
            std::shared_lock<std::shared_mutex> lk(markov_mu);
            P = markov.transition_matrix();
            states = markov.states();
        }
        return evaluate_action_long_term(P, states, action, rewards);
    } catch (const std::exception &e) {
        safe_log(std::string("evaluate_strategy: ") + e.what());
        return std::nullopt;
    }
}

double Aggregator::simulate(double speed, double accuracy, double stamina, size_t trials) noexcept {
    return simulator.simulate(speed, accuracy, stamina, trials);
}

std::optional<std::vector<SimilarPlayer>> Aggregator::similar_players(const std::string &player, size_t k) const noexcept {
    static const size_t FEATURES = 3;
    try {
        if (k == 0) k = 5;
        if (k > MAX_TOPK) k = MAX_TOPK;

        // snapshot the per-player means one shard at a time
        std::vector<std::string> names;
        std::vector<std::array<double, FEATURES>> rows;
        for (size_t s = 0; s < player_shard_count; ++s) {
            std::shared_lock<std::shared_mutex> lk(player_shard_mus[s]);
            for (auto &kv : player_shards[s]) {
                names.push_back(kv.first);
                rows.push_back({kv.second.speed.mean(), kv.second.accuracy.mean(), kv.second.stamina.mean()});
            }
        }

        auto target = std::find(names.begin(), names.end(), player);
        if (target == names.end()) return std::nullopt;
        const size_t t = static_cast<size_t>(target - names.begin());

        const double n = static_cast<double>(rows.size());
        std::array<double, FEATURES> mean{}, stddev{};
        for (auto &r : rows)
            for (size_t f = 0; f < FEATURES; ++f) mean[f] += r[f] / n;
        for (auto &r : rows)
            for (size_t f = 0; f < FEATURES; ++f) stddev[f] += (r[f] - mean[f]) * (r[f] - mean[f]) / n;
        for (size_t f = 0; f < FEATURES; ++f) stddev[f] = std::sqrt(stddev[f]);

        std::vector<SimilarPlayer> out;
        out.reserve(rows.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            if (i == t) continue;
            double d2 = 0.0;
            for (size_t f = 0; f < FEATURES; ++f) {
                if (!(stddev[f] > 0.0)) continue;
                double z = (rows[i][f] - rows[t][f]) / stddev[f];
                d2 += z * z;
            }
            out.push_back({names[i], std::sqrt(d2)});
        }
        std::sort(out.begin(), out.end(), [](const SimilarPlayer &a, const SimilarPlayer &b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return a.player < b.player;
        });
        if (out.size() > k) out.resize(k);
        return out;
    } catch (const std::exception &e) {
        safe_log(std::string("similar_players: exception: ") + e.what());
        return std::nullopt;
    }
}
