// tests/test_parser.cpp
#include <iostream>
#include <string>
#include <optional>
#include "../src/parser.hpp"

int main() {
    using namespace std;

    string line = R"(ts=1727000000 player=p17 sport=soccer play="corner kick" speed="12.5 m/s" accuracy=78% stamina=80 peak=yes prev=good state=peak)";
    optional<AthleteEvent> p = parse_event_line(line);
    if (!p) {
        cerr << "parse_event_line failed to parse valid line\n";
        return 2;
    }
    if (p->player != "p17" || p->sport != "soccer" || p->play_type != "corner kick") {
        cerr << "string fields mismatch: " << p->player << " / " << p->sport << " / " << p->play_type << "\n";
        return 3;
    }
    if (p->speed != 12.5 || p->accuracy != 78.0 || p->stamina != 80.0) {
        cerr << "units not stripped: " << p->speed << " " << p->accuracy << " " << p->stamina << "\n";
        return 4;
    }
    if (!p->peak || p->prev_state != "good" || p->state != "peak" || p->ts != 1727000000) {
        cerr << "flag/state/ts mismatch\n";
        return 5;
    }

    // minimal line: ts left for the worker to stamp
    optional<AthleteEvent> m = parse_event_line("player=p1 speed=7");
    if (!m || m->ts != 0 || m->peak || !m->prev_state.empty()) {
        cerr << "minimal line mis-parsed\n";
        return 6;
    }

    const char *bad_lines[] = {
        "this is not an event line",
        "speed=10",                         // no player
        "player=p1 accuracy=50",            // no speed
        "player= speed=10",
        "player=p1 speed=fast",
        "player=p1 speed=10 accuracy=50xyz1",
        "player=p1 speed=10 peak=maybe",
        "player=p1 speed=10 ts=-5",
        "player=p1 speed=10 ts=12abc",
        "player=p1 speed=nan",
        "player=p1 speed=1e300",
        "player=p1 speed=-3",
        "player=p1 speed=\"1001 m/s\"",
    };
    for (const char *b : bad_lines) {
        if (parse_event_line(b)) {
            cerr << "parse_event_line should have failed on: " << b << "\n";
            return 7;
        }
    }

    // the canonical form reads back to the same event
    optional<AthleteEvent> back = parse_event_line(format_event_line(*p));
    if (!back || back->player != p->player || back->play_type != p->play_type || back->speed != p->speed
        || back->peak != p->peak || back->state != p->state || back->ts != p->ts) {
        cerr << "format_event_line output not parseable: " << format_event_line(*p) << "\n";
        return 8;
    }

    cout << "test_parser: OK\n";
    return 0;
}
