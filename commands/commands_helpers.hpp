#pragma once
#include <string>
#include <utility>
#include <vector>
#include <optional>
#include "intent.hpp"
#include "commands_core.hpp"

// Get a slot value with fallback (empty values count as absent)
std::string getSlot(const Intent& intent, const std::string& name, const std::string& fallback = "");

// Required slot: {slot name, human-facing label}
using SlotRequirement = std::pair<std::string, std::string>;

// MissingSlots result listing every absent label at once, or nullopt
// when all are present:
//   "I need the following information: source city, travel date"
std::optional<ActionResult> checkRequiredSlots(const Intent& intent,
                                               const std::vector<SlotRequirement>& required);

// Result for features that are recognised but not built yet
ActionResult notImplemented(const std::string& message);
