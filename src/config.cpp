#include "config.hpp"
#include <sstream>
#include <stdexcept>
#include <limits>

static unsigned long long to_ull(const std::string &flag, const std::string &v) {
    size_t pos = 0;
    unsigned long long x = 0;
    try {
        if (!v.empty() && v[0] == '-') throw std::invalid_argument("negative");
        x = std::stoull(v, &pos);
    } catch (const std::exception &) {
        throw std::invalid_argument(flag + ": expected a non-negative integer, got '" + v + "'");
    }
    if (pos != v.size()) throw std::invalid_argument(flag + ": trailing characters in '" + v + "'");
    return x;
}

static double to_double(const std::string &flag, const std::string &v) {
    size_t pos = 0;
    double x = 0.0;
    try {
        x = std::stod(v, &pos);
    } catch (const std::exception &) {
        throw std::invalid_argument(flag + ": expected a number, got '" + v + "'");
    }
    if (pos != v.size()) throw std::invalid_argument(flag + ": trailing characters in '" + v + "'");
    return x;
}

std::vector<std::string> split_list(const std::string &s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

AppConfig parse_command_line(int argc, const char *const *argv) {
    AppConfig c;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(a + ": missing value");
            return argv[++i];
        };

        if (a == "--file") c.file = value();
        else if (a == "--follow") c.follow = true;
        else if (a == "--workers") c.workers = to_ull(a, value());
        else if (a == "--qcap") c.qcap = to_ull(a, value());
        else if (a == "--http-enable") c.http_enable = true;
        else if (a == "--http-port") {
            unsigned long long p = to_ull(a, value());
            if (p == 0 || p > 65535) throw std::invalid_argument("--http-port: must be in 1..65535");
            c.http_port = static_cast<int>(p);
        }
        else if (a == "--http-user") c.http_user = value();
        else if (a == "--http-pass") c.http_pass = value();
        else if (a == "--http-cache-ttl") c.http_cache_ttl = static_cast<unsigned>(to_ull(a, value()));
        else if (a == "--bloom-capacity") c.agg.bloom_capacity = to_ull(a, value());
        else if (a == "--bloom-error") c.agg.bloom_error_rate = to_double(a, value());
        else if (a == "--cms-width") c.agg.cms_width = to_ull(a, value());
        else if (a == "--cms-depth") c.agg.cms_depth = to_ull(a, value());
        else if (a == "--hll-precision") {
            unsigned long long p = to_ull(a, value());
            if (p > std::numeric_limits<uint8_t>::max()) throw std::invalid_argument("--hll-precision: out of range");
            c.agg.hll_precision = static_cast<uint8_t>(p);
        }
        else if (a == "--topk-capacity") c.agg.topk_capacity = to_ull(a, value());
        else if (a == "--sample-k") c.agg.sample_k = to_ull(a, value());
        else if (a == "--window") c.agg.window_seconds = static_cast<std::time_t>(to_ull(a, value()));
        else if (a == "--ams-k") c.agg.ams_k = to_ull(a, value());
        else if (a == "--states") c.agg.states = split_list(value());
        else if (a == "--smoothing") c.agg.smoothing = to_double(a, value());
        else if (a == "--mc-trials") c.agg.mc_trials = to_ull(a, value());
        else if (a == "--seed") c.agg.seed = to_ull(a, value());
        else if (a == "--player-shards") c.agg.player_shards = to_ull(a, value());
        else if (a == "--help" || a == "-h") c.show_help = true;
        else throw std::invalid_argument("unknown option: " + a);
    }
    return c;
}

std::string usage_text() {
    return
        "usage: perfpulse [options]\n"
        "  input:      --file PATH [--follow] | (stdin)\n"
        "  pipeline:   --workers N --qcap N\n"
        "  http:       --http-enable --http-port N --http-user U --http-pass P --http-cache-ttl S\n"
        "  sketches:   --bloom-capacity N --bloom-error P --cms-width N --cms-depth N\n"
        "              --hll-precision N --topk-capacity N --sample-k N --window S --ams-k N\n"
        "  markov:     --states a,b,c --smoothing X\n"
        "  simulation: --mc-trials N\n"
        "  seeding:    --seed N --player-shards N\n";
}
