#include "commands_helpers.hpp"

// ------------------------------------------------------------
// Get a slot value with fallback
// ------------------------------------------------------------
std::string getSlot(const Intent& intent, const std::string& name, const std::string& fallback) {
    auto it = intent.slots.find(name);
    if (it == intent.slots.end() || it->second.empty()) return fallback;
    return it->second;
}

// ------------------------------------------------------------
// Required slot validation
// ------------------------------------------------------------
std::optional<ActionResult> checkRequiredSlots(const Intent& intent,
                                               const std::vector<SlotRequirement>& required) {
    std::vector<std::string> missing;
    for (const auto& [slot, label] : required) {
        if (!intent.hasSlot(slot)) missing.push_back(label);
    }
    if (missing.empty()) return std::nullopt;

    std::string list;
    for (const auto& label : missing) {
        if (!list.empty()) list += ", ";
        list += label;
    }

    ActionResult result;
    result.status = ActionStatus::MissingSlots;
    result.message = "I need the following information: " + list;
    result.data["missing"] = missing;
    return result;
}

ActionResult notImplemented(const std::string& message) {
    ActionResult result;
    result.status = ActionStatus::Unimplemented;
    result.message = message;
    return result;
}
