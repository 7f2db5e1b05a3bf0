#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include "aggregator.hpp"

struct AppConfig {
    std::string file;          // empty = stdin
    bool follow = false;
    size_t workers = 0;        // 0 = hardware_concurrency
    size_t qcap = 1 << 16;

    bool http_enable = false;
    int http_port = 8080;
    std::string http_user, http_pass;
    unsigned http_cache_ttl = 1;

    bool show_help = false;

    AggregatorConfig agg;
};

// Parse argv flags. Throws std::invalid_argument on an unknown flag, a flag
// missing its value, or a malformed number. Algorithm parameters are checked
// later by the component constructors.
AppConfig parse_command_line(int argc, const char *const *argv);

std::string usage_text();

// "a,b,c" -> {"a","b","c"}; empty items are dropped
std::vector<std::string> split_list(const std::string &s, char sep = ',');
