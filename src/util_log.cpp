#include "util_log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>

static std::mutex g_log_mu_internal;

static std::string log_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char buf[32];
    std::tm tmv{};
#ifdef _WIN32
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return buf;
}

void safe_log(const std::string &s) {
    std::lock_guard<std::mutex> lk(g_log_mu_internal);
    std::string line = "[" + log_timestamp() + "] " + s;
    std::cerr << line << std::endl;
    // append-only file beside the process
    std::ofstream f("perfpulse.err.log", std::ios::app);
    if (f) f << line << std::endl;
}
