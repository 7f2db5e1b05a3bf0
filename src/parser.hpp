#pragma once
#include <string>
#include <optional>
#include "aggregator.hpp"

// Parse one `key=value` event line, e.g.
//   ts=1727000000 player=p17 sport=soccer play=offensive speed="12.5 m/s" accuracy=78% stamina=80 peak=1 prev=good state=peak
// `player` and `speed` are required, speed within [0, MAX_EVENT_SPEED].
// Units after numbers are stripped.
// Returns nullopt for malformed lines. A missing ts leaves ts == 0.
std::optional<AthleteEvent> parse_event_line(const std::string &line);

// Canonical line form of an event; parse_event_line() reads it back.
std::string format_event_line(const AthleteEvent &e);
