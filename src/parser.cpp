#include "parser.hpp"
#include <regex>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <cerrno>
#include <cmath>

// number followed by an optional unit ("12.5 m/s", "78%", "80")
static std::optional<double> parse_measure(const std::string &v) {
    static const std::regex unit_tail(R"(^\s*[A-Za-z%/]*\s*$)");
    const char *begin = v.c_str();
    char *end = nullptr;
    errno = 0;
    double d = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE || !std::isfinite(d)) return std::nullopt;
    if (!std::regex_match(std::string(end), unit_tail)) return std::nullopt;
    return d;
}

static std::optional<bool> parse_flag(const std::string &v) {
    std::string s;
    for (char c : v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "1" || s == "true" || s == "yes" || s == "y") return true;
    if (s == "0" || s == "false" || s == "no" || s == "n") return false;
    return std::nullopt;
}

std::optional<AthleteEvent> parse_event_line(const std::string &line) {
    static const std::regex field(R"re((\w+)=(?:"([^"]*)"|(\S+)))re");

    AthleteEvent e;
    bool have_player = false, have_speed = false;

    for (auto it = std::sregex_iterator(line.begin(), line.end(), field); it != std::sregex_iterator(); ++it) {
        const std::smatch &m = *it;
        const std::string key = m[1].str();
        const std::string val = m[2].matched ? m[2].str() : m[3].str();

        if (key == "player") {
            if (val.empty()) return std::nullopt;
            e.player = val;
            have_player = true;
        } else if (key == "sport") {
            e.sport = val;
        } else if (key == "play") {
            e.play_type = val;
        } else if (key == "speed" || key == "accuracy" || key == "stamina") {
            auto d = parse_measure(val);
            if (!d) return std::nullopt;
            if (key == "speed") {
                if (*d < 0.0 || *d > MAX_EVENT_SPEED) return std::nullopt;
                e.speed = *d;
                have_speed = true;
            }
            else if (key == "accuracy") e.accuracy = *d;
            else e.stamina = *d;
        } else if (key == "peak") {
            auto f = parse_flag(val);
            if (!f) return std::nullopt;
            e.peak = *f;
        } else if (key == "prev") {
            e.prev_state = val;
        } else if (key == "state") {
            e.state = val;
        } else if (key == "ts") {
            const char *begin = val.c_str();
            char *end = nullptr;
            errno = 0;
            long long t = std::strtoll(begin, &end, 10);
            if (end == begin || *end != '\0' || errno == ERANGE || t < 0) return std::nullopt;
            e.ts = static_cast<std::time_t>(t);
        }
        // other keys are ignored
    }

    if (!have_player || !have_speed) return std::nullopt;
    return e;
}

static void put_field(std::ostringstream &os, const char *key, const std::string &v) {
    if (v.empty()) return;
    os << ' ' << key << '=';
    if (v.find_first_of(" \t") != std::string::npos) os << '"' << v << '"';
    else os << v;
}

std::string format_event_line(const AthleteEvent &e) {
    std::ostringstream os;
    os << "ts=" << static_cast<long long>(e.ts);
    put_field(os, "player", e.player);
    put_field(os, "sport", e.sport);
    put_field(os, "play", e.play_type);
    os << " speed=" << e.speed
       << " accuracy=" << e.accuracy
       << " stamina=" << e.stamina
       << " peak=" << (e.peak ? 1 : 0);
    put_field(os, "prev", e.prev_state);
    put_field(os, "state", e.state);
    return os.str();
}
