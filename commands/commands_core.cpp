#include "commands_core.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

// ------------------------------------------------------------
// ActionResult helpers
// ------------------------------------------------------------
const char* actionStatusName(ActionStatus status) {
    switch (status) {
        case ActionStatus::Success:       return "success";
        case ActionStatus::Error:         return "error";
        case ActionStatus::MissingSlots:  return "missing_slots";
        case ActionStatus::NotFound:      return "not_found";
        case ActionStatus::Unimplemented: return "not_implemented";
    }
    return "error";
}

nlohmann::json ActionResult::toJson() const {
    nlohmann::json j = data.is_object() ? data : nlohmann::json::object();
    j["status"] = actionStatusName(status);
    j["message"] = message;
    if (!errorCode.empty()) j["error_code"] = errorCode;
    return j;
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------
void CommandRouter::registerHandler(IntentKind kind, ActionHandler handler) {
    handlers_[kind] = std::move(handler);
}

bool CommandRouter::hasHandler(IntentKind kind) const {
    return handlers_.count(kind) > 0;
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
ActionResult CommandRouter::route(const Intent& intent,
                                  const std::string& userId,
                                  const UserContext& context) const {
    const std::string kindName = intentKindName(intent.kind);

    auto it = handlers_.find(intent.kind);
    if (it == handlers_.end() || !it->second) {
        LOG_DEBUG("Router", "No handler for intent=" + kindName);
        ActionResult result;
        result.status = ActionStatus::Unimplemented;
        result.message = ErrorManager::getUserMessage("ERR_ROUTER_UNKNOWN_INTENT");
        result.errorCode = "ERR_ROUTER_UNKNOWN_INTENT";
        return result;
    }

    LOG_DEBUG("Router", "Dispatching intent=" + kindName + " user=" + userId);
    try {
        ActionResult result = it->second(intent, userId, context);
        LOG_DEBUG("Router", "intent=" + kindName + " -> " + actionStatusName(result.status));
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Router", "Exception in handler for " + kindName + ": " + e.what());
        ActionResult result = ErrorManager::report("ERR_ROUTER_EXCEPTION");
        result.data["error"] = e.what();
        return result;
    } catch (...) {
        LOG_ERROR("Router", "Non-standard exception in handler for " + kindName);
        return ErrorManager::report("ERR_ROUTER_EXCEPTION");
    }
}
