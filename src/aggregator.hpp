#pragma once

#include <atomic>
#include <unordered_map>
#include <shared_mutex>
#include <string>
#include <vector>
#include <optional>
#include <ctime>
#include <cstdint>
#include <cstddef>

#include "bloom_filter.hpp"
#include "hyperloglog.hpp"
#include "cms.hpp"
#include "space_saving.hpp"
#include "minhash_sampler.hpp"
#include "exponential_histogram.hpp"
#include "ams_f2.hpp"
#include "running_moments.hpp"
#include "markov_model.hpp"
#include "markov_strategy.hpp"
#include "monte_carlo.hpp"

// Upper bound on a plausible speed (m/s); faster events are malformed.
constexpr double MAX_EVENT_SPEED = 1000.0;

// Request limits shared by the HTTP and console surfaces.
constexpr size_t MAX_PREDICT_STEPS = 1000;
constexpr size_t MAX_SIM_TRIALS = 100000;

// One normalized performance record. Units are already stripped.
struct AthleteEvent {
    std::string player;
    std::string sport;
    std::string play_type;
    double speed = 0.0;     // m/s
    double accuracy = 0.0;  // 0-100
    double stamina = 0.0;   // 0-100
    bool peak = false;
    std::string prev_state; // empty when the record carries no transition
    std::string state;
    std::time_t ts = 0;
};

struct AggregatorConfig {
    size_t bloom_capacity = 10000;
    double bloom_error_rate = 0.001;
    size_t cms_width = 2000;
    size_t cms_depth = 5;
    uint8_t hll_precision = 12;
    size_t topk_capacity = 256;
    size_t sample_k = 200;
    std::time_t window_seconds = 300;
    size_t ams_k = 10;
    std::vector<std::string> states{"peak", "good", "average", "declining", "injured"};
    double smoothing = 1e-3;
    size_t mc_trials = 1000;
    uint64_t seed = 42;
    size_t player_shards = 16;
};

struct MomentsSnapshot {
    uint64_t n = 0;
    double mean = 0.0;
    double variance = 0.0;
    double skewness = 0.0;
    double kurtosis = 0.0;
};

struct PlayerSummary {
    uint64_t approx_events = 0; // CMS estimate
    MomentsSnapshot speed;
    MomentsSnapshot accuracy;
    MomentsSnapshot stamina;
};

// One neighbour from similar_players(); distance is in standardized units.
struct SimilarPlayer {
    std::string player;
    double distance = 0.0;
};

struct MarkovSummary {
    std::vector<std::string> states;
    Matrix matrix;
    MarkovModel::Stationary stationary;
    bool aperiodic = false;
    bool irreducible = false;
    size_t mixing_time = 0;
};

// Aggregator: owns one instance of every sketch/model and routes each event
// through all of them. The algorithm classes are single-writer and
// unsynchronized; each one here gets its own shared_mutex (unique for
// updates, shared for queries) so ingestion workers and readers can overlap.
class Aggregator {
    AggregatorConfig cfg_;

    std::atomic<uint64_t> total_events{0}, parse_errors{0}, new_play_types{0};

    mutable std::shared_mutex bloom_mu;
    BloomFilter play_filter;

    mutable std::shared_mutex hll_mu;
    HyperLogLog distinct_plays;

    mutable std::shared_mutex cms_mu;
    CountMinSketch player_cms;

    mutable std::shared_mutex ss_mu;
    SpaceSaving top_players_ss;

    mutable std::shared_mutex sampler_mu;
    MinHashSampler peak_sampler;

    mutable std::shared_mutex window_mu;
    ExponentialHistogram peak_window;
    std::time_t window_last_ts = 0;

    mutable std::shared_mutex ams_mu;
    AmsF2Sketch speed_ams;

    // per-player running moments, sharded by player key
    struct PlayerStats {
        RunningMoments speed;
        RunningMoments accuracy;
        RunningMoments stamina;
    };
    size_t player_shard_count;
    mutable std::vector<std::shared_mutex> player_shard_mus;
    std::vector<std::unordered_map<std::string, PlayerStats>> player_shards;

    mutable std::shared_mutex markov_mu;
    MarkovModel markov;

    MonteCarloSimulator simulator; // locks internally

public:
    // throws std::invalid_argument when any component rejects its parameters
    explicit Aggregator(const AggregatorConfig &cfg = AggregatorConfig{});

    // ingest / counters
    // An event whose speed is outside [0, MAX_EVENT_SPEED] is counted as a
    // parse error and not ingested.
    void add_event(const AthleteEvent &e);
    void add_parse_error();

    // reads
    uint64_t get_total() const noexcept;
    uint64_t get_errors() const noexcept;
    uint64_t get_new_play_types() const noexcept;

    bool play_type_seen(const std::string &sport, const std::string &play) const noexcept;
    double distinct_plays_estimate() const noexcept;
    uint64_t approx_player_count(const std::string &player) const noexcept;
    std::vector<std::pair<std::string,uint64_t>> top_players(size_t K) const noexcept;
    std::vector<std::string> peak_sample() const noexcept;
    uint64_t peaks_in_window(std::time_t now) const noexcept;
    // newest event timestamp ingested so far (0 before the first event)
    std::time_t latest_event_ts() const noexcept;
    double speed_f2() const noexcept;
    std::optional<PlayerSummary> player_summary(const std::string &player) const noexcept;
    size_t tracked_players() const noexcept;

    // k nearest players to `player` by Euclidean distance over the z-scored
    // per-player means of speed, accuracy and stamina (population mean and
    // standard deviation across all tracked players; a feature with no spread
    // is skipped). Nearest first, ties by name, `player` itself excluded.
    // k == 0 selects 5. nullopt if `player` has no data.
    std::optional<std::vector<SimilarPlayer>> similar_players(const std::string &player, size_t k) const noexcept;

    // transition model
    MarkovSummary markov_summary() const noexcept;
    std::optional<StateDistribution> predict_state(const std::string &state, size_t steps) const noexcept;
    std::optional<ActionEvaluation> evaluate_strategy(const std::string &action,
                                                      const std::unordered_map<std::string,double> &rewards) const noexcept;

    double simulate(double speed, double accuracy, double stamina, size_t trials = 0) noexcept;

    const AggregatorConfig &config() const noexcept { return cfg_; }
};
