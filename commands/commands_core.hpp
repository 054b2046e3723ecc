#pragma once
#include <string>
#include <map>
#include <functional>
#include <nlohmann/json.hpp>
#include "intent.hpp"

// Forward declarations
struct UserContext;

// ------------------------------------------------------------
// ActionResult: uniform return type for every action handler
// ------------------------------------------------------------
enum class ActionStatus {
    Success,
    Error,
    MissingSlots,
    NotFound,
    Unimplemented
};

const char* actionStatusName(ActionStatus status);

struct ActionResult {
    ActionStatus status = ActionStatus::Success;
    std::string message;                            // user-facing text
    nlohmann::json data = nlohmann::json::object(); // handler-specific payload
    std::string errorCode;                          // optional ErrorManager code

    bool ok() const { return status == ActionStatus::Success; }

    nlohmann::json toJson() const;
};

// ------------------------------------------------------------
// Handler signature
// ------------------------------------------------------------
using ActionHandler = std::function<ActionResult(const Intent& intent,
                                                 const std::string& userId,
                                                 const UserContext& context)>;

// ------------------------------------------------------------
// CommandRouter: IntentKind -> handler
// ------------------------------------------------------------
class CommandRouter {
public:
    // Later registrations for the same kind replace earlier ones.
    void registerHandler(IntentKind kind, ActionHandler handler);
    bool hasHandler(IntentKind kind) const;

    // Never throws. Kinds without a handler yield Unimplemented;
    // handler exceptions become Error.
    ActionResult route(const Intent& intent,
                       const std::string& userId,
                       const UserContext& context) const;

private:
    std::map<IntentKind, ActionHandler> handlers_;
};
