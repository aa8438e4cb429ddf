#pragma once

#include <optional>
#include <string>

#include "chaosmine/core/entities.h"

namespace chaosmine {

// Shared string <-> enum conversion helpers.
//
// Used by config loading, state export and log messages so the strings never drift.

std::string event_type_to_string(EventType t);
std::optional<EventType> event_type_from_string(const std::string& s);

std::string burn_source_to_string(BurnSource s);
std::optional<BurnSource> burn_source_from_string(const std::string& s);

} // namespace chaosmine
