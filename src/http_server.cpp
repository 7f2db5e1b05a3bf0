// src/http_server.cpp
// Lightweight HTTP server for the read-only query endpoints.
// Provides caching (TTL) for the summary bodies and optional Basic Auth.
//
// Portable: uses winsock2 on Windows and BSD sockets on POSIX.

#include "http_server.hpp"
#include "util_log.hpp"

#include <string>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <cstdlib>

#if defined(_WIN32)
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #define WIN32_LEAN_AND_MEAN
  #include <winsock2.h>
  #include <ws2tcpip.h>
  using socklen_t = int;
  static const int INVALID_SOCKET_FD = INVALID_SOCKET;
  #define HEADER_EQ(a,b) (_stricmp((a),(b))==0)
#else
  #include <unistd.h>
  #include <strings.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <netdb.h>
  #include <arpa/inet.h>
  #define closesocket close
  static const int INVALID_SOCKET_FD = -1;
  #define HEADER_EQ(a,b) (strcasecmp((a),(b))==0)
#endif

using steady_clock_t = std::chrono::steady_clock;

static const size_t MAX_SIMILAR_K = 100;

static std::string url_decode(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i=0;i<s.size();++i) {
        char c = s[i];
        if (c == '+') out.push_back(' ');
        else if (c == '%' && i+2 < s.size()) {
            std::string hex2 = s.substr(i+1,2);
            char dec = static_cast<char>(std::strtol(hex2.c_str(), nullptr, 16));
            out.push_back(dec);
            i += 2;
        } else out.push_back(c);
    }
    return out;
}

static std::string get_query_param(const std::string &q, const std::string &key) {
    if (q.empty()) return {};
    size_t pos = 0;
    while (pos < q.size()) {
        size_t amp = q.find('&', pos);
        std::string pair = q.substr(pos, (amp==std::string::npos ? std::string::npos : amp-pos));
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            std::string k = url_decode(pair.substr(0, eq));
            if (k == key) return url_decode(pair.substr(eq+1));
        }
        if (amp==std::string::npos) break;
        pos = amp + 1;
    }
    return {};
}

// strict: the whole parameter must be a finite number
static bool param_double(const std::string &q, const std::string &key, double &out) {
    std::string v = get_query_param(q, key);
    if (v.empty()) return false;
    char *end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (end == v.c_str() || *end != '\0' || !std::isfinite(d)) return false;
    out = d;
    return true;
}

static bool param_size(const std::string &q, const std::string &key, size_t &out) {
    std::string v = get_query_param(q, key);
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c){ return std::isdigit(c); }))
        return false;
    if (v.size() > 9) v = "999999999"; // callers clamp anyway
    out = static_cast<size_t>(std::strtoull(v.c_str(), nullptr, 10));
    return true;
}

static std::string json_escape(const std::string &s) {
    std::ostringstream os;
    for (unsigned char c : s) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << int(c) << std::dec;
                else os << c;
        }
    }
    return os.str();
}

static void write_distribution(std::ostream &out, const StateDistribution &d) {
    out << "{";
    for (size_t i = 0; i < d.size(); ++i) {
        if (i) out << ", ";
        out << "\"" << json_escape(d[i].first) << "\":" << d[i].second;
    }
    out << "}";
}

static void write_moments(std::ostream &out, const MomentsSnapshot &m) {
    out << "{\"n\":" << m.n << ",\"mean\":" << m.mean << ",\"variance\":" << m.variance
        << ",\"skewness\":" << m.skewness << ",\"kurtosis\":" << m.kurtosis << "}";
}

static const char *reason_phrase(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

static std::string http_response(int code, const std::string &body, const std::string &ct="text/plain; charset=utf-8") {
    std::ostringstream os;
    os << "HTTP/1.1 " << code << " " << reason_phrase(code) << "\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Content-Type: " << ct << "\r\n"
       << "Connection: close\r\n"
       << "\r\n"
       << body;
    return os.str();
}

static std::string http_401() {
    std::string body = "401 Unauthorized";
    std::ostringstream os;
    os << "HTTP/1.1 401 Unauthorized\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "WWW-Authenticate: Basic realm=\"perfpulse\"\r\n"
       << "Connection: close\r\n"
       << "Content-Type: text/plain\r\n"
       << "\r\n"
       << body;
    return os.str();
}

static void send_all(int sock, const std::string &resp) {
    size_t sent = 0;
    while (sent < resp.size()) {
        int r = static_cast<int>(send(sock, resp.data() + sent, static_cast<int>(resp.size() - sent), 0));
        if (r <= 0) return;
        sent += static_cast<size_t>(r);
    }
}

// ---------- HttpServer implementation ----------

HttpServer::HttpServer(const std::string &bind_addr,
                       uint16_t port,
                       Aggregator &agg_ref,
                       unsigned cache_ttl_seconds,
                       const std::string &auth_expected,
                       const BoundedQueue<std::string> *queue)
    : bind_addr_(bind_addr),
      port_(port),
      agg_(agg_ref),
      cache_ttl_(std::chrono::seconds(cache_ttl_seconds)),
      auth_expected_header_(auth_expected),
      queue_(queue),
      listen_sock_(INVALID_SOCKET_FD),
      running_(false),
      refresher_running_(false)
{
#if defined(_WIN32)
    WSADATA wsa;
    if (WSAStartup(MAKEWORD(2,2), &wsa) != 0) {
        safe_log("HttpServer: WSAStartup failed");
    }
#endif
    cached_at_ = steady_clock_t::time_point{}; // expired
}

HttpServer::~HttpServer() {
    stop();
#if defined(_WIN32)
    WSACleanup();
#endif
}

bool HttpServer::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_) return true;

    listen_sock_ = static_cast<int>(socket(AF_INET, SOCK_STREAM, 0));
    if (listen_sock_ == INVALID_SOCKET_FD) {
        safe_log("HttpServer: socket() failed");
        return false;
    }

    int opt = 1;
    setsockopt(listen_sock_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<char*>(&opt), sizeof(opt));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    addr.sin_addr.s_addr = (bind_addr_.empty() ? INADDR_ANY : inet_addr(bind_addr_.c_str()));

    if (bind(listen_sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        safe_log("HttpServer: bind() failed on port " + std::to_string(port_));
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
        return false;
    }

    if (listen(listen_sock_, 16) < 0) {
        safe_log("HttpServer: listen() failed");
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
        return false;
    }

    running_ = true;
    worker_thread_ = std::thread([this]{ this->accept_loop(); });

    if (cache_ttl_ > std::chrono::seconds(0)) {
        refresher_running_.store(true);
        refresher_thread_ = std::thread([this]{
            while (refresher_running_.load()) {
                std::this_thread::sleep_for(cache_ttl_);
                if (refresher_running_.load()) this->rebuild_cache_now();
            }
        });
    }

    safe_log(std::string("HttpServer started on port ") + std::to_string(port_));
    return true;
}

void HttpServer::stop() {
    {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        if (!running_) return;
        running_ = false;
    }

    refresher_running_.store(false);
    if (refresher_thread_.joinable()) refresher_thread_.join();

    if (listen_sock_ != INVALID_SOCKET_FD) {
#if !defined(_WIN32)
        shutdown(listen_sock_, SHUT_RDWR); // wakes accept()
#endif
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
    }

    if (worker_thread_.joinable()) worker_thread_.join();

    safe_log("HttpServer stopped");
}

void HttpServer::accept_loop() {
    while (running_) {
        sockaddr_in client;
        socklen_t clen = sizeof(client);
        int cli_sock = static_cast<int>(accept(listen_sock_, reinterpret_cast<sockaddr*>(&client), &clen));
        if (!running_) {
            if (cli_sock != INVALID_SOCKET_FD) closesocket(cli_sock);
            break;
        }
        if (cli_sock == INVALID_SOCKET_FD) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        std::thread(&HttpServer::handle_connection, this, cli_sock).detach();
    }
}

// read until "\r\n\r\n" or error. returns true if we read something.
static bool recv_request(int sock, std::string &out_req) {
    out_req.clear();
    char buf[4096];
    while (true) {
        int r = static_cast<int>(recv(sock, buf, sizeof(buf), 0));
        if (r <= 0) return (r==0 && !out_req.empty());
        out_req.append(buf, buf + r);
        if (out_req.find("\r\n\r\n") != std::string::npos) break;
        if (out_req.size() > 64*1024) return false;
    }
    return true;
}

void HttpServer::handle_connection(int sock_fd) {
    std::string req;
    if (!recv_request(sock_fd, req)) { closesocket(sock_fd); return; }

    std::istringstream rs(req);
    std::string method, target, proto;
    rs >> method >> target >> proto;

    // only Authorization matters
    std::string line;
    std::string auth_hdr;
    std::getline(rs, line);
    while (std::getline(rs, line)) {
        if (line == "\r" || line.empty()) break;
        size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string hn = line.substr(0, c);
            std::string hv = line.substr(c+1);
            size_t p = 0; while (p < hv.size() && std::isspace((unsigned char)hv[p])) ++p;
            hv = hv.substr(p);
            if (!hv.empty() && hv.back() == '\r') hv.pop_back();
            if (HEADER_EQ(hn.c_str(), "Authorization")) auth_hdr = hv;
        }
    }

    if (!auth_expected_header_.empty() && auth_hdr != auth_expected_header_) {
        send_all(sock_fd, http_401());
        closesocket(sock_fd);
        return;
    }

    if (method != "GET") {
        send_all(sock_fd, http_response(405, "Only GET supported\n"));
        closesocket(sock_fd);
        return;
    }

    std::string body, ct;
    int code = 500;
    try {
        code = route(target, body, ct);
    } catch (const std::exception &e) {
        safe_log(std::string("HttpServer: error serving ") + target + ": " + e.what());
        code = 500;
        body = std::string("error building response: ") + e.what() + "\n";
        ct = "text/plain; charset=utf-8";
    }
    send_all(sock_fd, http_response(code, body, ct));
    closesocket(sock_fd);
}

int HttpServer::route(const std::string &target, std::string &body, std::string &ct) {
    std::string path = target;
    std::string query;
    size_t qpos = target.find('?');
    if (qpos != std::string::npos) {
        path = target.substr(0, qpos);
        query = target.substr(qpos + 1);
    }

    const std::string json = "application/json";
    ct = json;
    std::ostringstream out;

    if (path == "/health") {
        out << "{\"status\":\"ok\",\"events\":" << agg_.get_total();
        if (queue_) out << ",\"queue_depth\":" << queue_->size();
        out << "}\n";
        body = out.str();
        return 200;
    }

    if (path == "/stats" || path == "/metrics") {
        bool fresh;
        {
            std::lock_guard<std::mutex> lk(cache_mu_);
            fresh = !cached_stats_.empty() && (steady_clock_t::now() - cached_at_) < cache_ttl_;
            if (fresh) body = (path == "/stats") ? cached_stats_ : cached_metrics_;
        }
        if (!fresh) {
            rebuild_cache_now();
            std::lock_guard<std::mutex> lk(cache_mu_);
            body = (path == "/stats") ? cached_stats_ : cached_metrics_;
        }
        if (body.empty()) {
            ct = "text/plain; charset=utf-8";
            body = "summary unavailable\n";
            return 500;
        }
        if (path == "/metrics") ct = "text/plain; version=0.0.4";
        return 200;
    }

    if (path == "/api/player") {
        std::string id = get_query_param(query, "id");
        if (id.empty()) {
            body = "{\"error\":\"missing id\"}\n";
            return 400;
        }
        auto s = agg_.player_summary(id);
        if (!s) {
            body = "{\"error\":\"unknown player\"}\n";
            return 404;
        }
        out << "{\"player\":\"" << json_escape(id) << "\",\"approx_events\":" << s->approx_events
            << ",\"speed\":";
        write_moments(out, s->speed);
        out << ",\"accuracy\":";
        write_moments(out, s->accuracy);
        out << ",\"stamina\":";
        write_moments(out, s->stamina);
        out << "}\n";
        body = out.str();
        return 200;
    }

    if (path == "/api/similar") {
        std::string id = get_query_param(query, "id");
        size_t k = 5;
        if (id.empty() || (!get_query_param(query, "k").empty() && !param_size(query, "k", k))) {
            body = "{\"error\":\"usage: /api/similar?id=P&k=N\"}\n";
            return 400;
        }
        k = std::min(k, MAX_SIMILAR_K);
        auto nearest = agg_.similar_players(id, k);
        if (!nearest) {
            body = "{\"error\":\"unknown player\"}\n";
            return 404;
        }
        out << "{\"player\":\"" << json_escape(id) << "\",\"similar\":[";
        for (size_t i = 0; i < nearest->size(); ++i) {
            if (i) out << ",";
            out << "{\"player\":\"" << json_escape((*nearest)[i].player) << "\",\"distance\":" << (*nearest)[i].distance << "}";
        }
        out << "]}\n";
        body = out.str();
        return 200;
    }

    if (path == "/api/markov") {
        MarkovSummary m = agg_.markov_summary();
        out << "{\"states\":[";
        for (size_t i = 0; i < m.states.size(); ++i) {
            if (i) out << ",";
            out << "\"" << json_escape(m.states[i]) << "\"";
        }
        out << "],\"matrix\":[";
        for (size_t i = 0; i < m.matrix.size(); ++i) {
            if (i) out << ",";
            out << "[";
            for (size_t j = 0; j < m.matrix[i].size(); ++j) {
                if (j) out << ",";
                out << m.matrix[i][j];
            }
            out << "]";
        }
        out << "],\"stationary\":";
        write_distribution(out, m.stationary.distribution);
        out << ",\"stationary_iterations\":" << m.stationary.iterations
            << ",\"stationary_converged\":" << (m.stationary.converged ? "true" : "false")
            << ",\"aperiodic\":" << (m.aperiodic ? "true" : "false")
            << ",\"irreducible\":" << (m.irreducible ? "true" : "false")
            << ",\"mixing_time\":" << m.mixing_time << "}\n";
        body = out.str();
        return 200;
    }

    if (path == "/api/predict") {
        std::string state = get_query_param(query, "state");
        size_t steps = 1;
        if (state.empty() || (!get_query_param(query, "steps").empty() && !param_size(query, "steps", steps))) {
            body = "{\"error\":\"usage: /api/predict?state=S&steps=N\"}\n";
            return 400;
        }
        steps = std::min(steps, MAX_PREDICT_STEPS);
        auto dist = agg_.predict_state(state, steps);
        if (!dist) {
            body = "{\"error\":\"unknown state\"}\n";
            return 404;
        }
        out << "{\"state\":\"" << json_escape(state) << "\",\"steps\":" << steps << ",\"distribution\":";
        write_distribution(out, *dist);
        out << "}\n";
        body = out.str();
        return 200;
    }

    if (path == "/api/simulate") {
        double speed = 0, accuracy = 0, stamina = 0;
        if (!param_double(query, "speed", speed) || !param_double(query, "accuracy", accuracy)
            || !param_double(query, "stamina", stamina)) {
            body = "{\"error\":\"usage: /api/simulate?speed=X&accuracy=Y&stamina=Z[&n=N]\"}\n";
            return 400;
        }
        size_t n = 0;
        if (!get_query_param(query, "n").empty() && !param_size(query, "n", n)) {
            body = "{\"error\":\"n must be a non-negative integer\"}\n";
            return 400;
        }
        n = std::min(n, MAX_SIM_TRIALS);
        size_t trials = n ? n : agg_.config().mc_trials;
        double p = agg_.simulate(speed, accuracy, stamina, n);
        out << "{\"success_probability\":" << p << ",\"trials\":" << trials << "}\n";
        body = out.str();
        return 200;
    }

    ct = "text/plain; charset=utf-8";
    body = "not found\n";
    return 404;
}

std::string HttpServer::build_stats_json() const {
    auto top = agg_.top_players(10);
    std::ostringstream out;
    out << "{\n";
    out << "  \"total_events\": " << agg_.get_total() << ",\n";
    out << "  \"parse_errors\": " << agg_.get_errors() << ",\n";
    out << "  \"new_play_types\": " << agg_.get_new_play_types() << ",\n";
    out << "  \"distinct_plays\": " << std::fixed << std::setprecision(1) << agg_.distinct_plays_estimate() << ",\n";
    out << std::defaultfloat << std::setprecision(6);
    out << "  \"tracked_players\": " << agg_.tracked_players() << ",\n";
    out << "  \"peaks_in_window\": " << agg_.peaks_in_window(agg_.latest_event_ts()) << ",\n";
    out << "  \"speed_f2\": " << agg_.speed_f2() << ",\n";
    out << "  \"peak_sample_size\": " << agg_.peak_sample().size() << ",\n";
    out << "  \"top_players\": [";
    for (size_t i = 0; i < top.size(); ++i) {
        if (i) out << ", ";
        out << "{\"player\":\"" << json_escape(top[i].first) << "\",\"count\":" << top[i].second << "}";
    }
    out << "]\n";
    out << "}\n";
    return out.str();
}

std::string HttpServer::build_metrics_text() const {
    auto top = agg_.top_players(10);
    std::ostringstream out;
    out << "# HELP perfpulse_events_total Events ingested\n";
    out << "# TYPE perfpulse_events_total counter\n";
    out << "perfpulse_events_total " << agg_.get_total() << "\n";
    out << "# HELP perfpulse_parse_errors_total Rejected input lines\n";
    out << "# TYPE perfpulse_parse_errors_total counter\n";
    out << "perfpulse_parse_errors_total " << agg_.get_errors() << "\n";
    out << "# HELP perfpulse_new_play_types_total Play types seen for the first time\n";
    out << "perfpulse_new_play_types_total " << agg_.get_new_play_types() << "\n";
    out << "# HELP perfpulse_distinct_plays Approximate distinct sport/play/player triples\n";
    out << "# TYPE perfpulse_distinct_plays gauge\n";
    out << "perfpulse_distinct_plays " << agg_.distinct_plays_estimate() << "\n";
    out << "# HELP perfpulse_peaks_in_window Performance peaks in the sliding window\n";
    out << "# TYPE perfpulse_peaks_in_window gauge\n";
    out << "perfpulse_peaks_in_window " << agg_.peaks_in_window(agg_.latest_event_ts()) << "\n";
    out << "# HELP perfpulse_speed_f2 Second frequency moment of floor(speed)\n";
    out << "# TYPE perfpulse_speed_f2 gauge\n";
    out << "perfpulse_speed_f2 " << agg_.speed_f2() << "\n";
    if (queue_) {
        out << "# HELP perfpulse_queue_depth Lines waiting for a worker\n";
        out << "# TYPE perfpulse_queue_depth gauge\n";
        out << "perfpulse_queue_depth " << queue_->size() << "\n";
    }
    out << "# HELP perfpulse_top_player Approximate event count of the heaviest players\n";
    out << "# TYPE perfpulse_top_player gauge\n";
    for (size_t i = 0; i < top.size(); ++i)
        out << "perfpulse_top_player{rank=\"" << (i+1) << "\",player=\"" << json_escape(top[i].first) << "\"} "
            << top[i].second << "\n";
    return out.str();
}

// Rebuild both cached bodies. Never throws outward.
void HttpServer::rebuild_cache_now() {
    try {
        std::string stats = build_stats_json();
        std::string metrics = build_metrics_text();
        std::lock_guard<std::mutex> lk(cache_mu_);
        cached_stats_ = std::move(stats);
        cached_metrics_ = std::move(metrics);
        cached_at_ = steady_clock_t::now();
    } catch (const std::exception &e) {
        safe_log(std::string("HttpServer::rebuild_cache_now exception: ") + e.what());
        std::lock_guard<std::mutex> lk(cache_mu_);
        cached_stats_.clear();
        cached_metrics_.clear();
        cached_at_ = steady_clock_t::time_point{};
    }
}
