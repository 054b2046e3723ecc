#include "commands.hpp"
#include "commands/commands_helpers.hpp"
#include "context.hpp"
#include "logger.hpp"

// ------------------------------------------------------------
// Dispatch table
// ------------------------------------------------------------
void initCommands(CommandRouter& router, const CommandServices& services) {
    if (auto alarms = services.alarms) {
        router.registerHandler(IntentKind::SetAlarm,
            [alarms](const Intent& intent, const std::string& userId, const UserContext& ctx) {
                return handleSetAlarm(*alarms, intent, userId, ctx);
            });
        router.registerHandler(IntentKind::DeleteAlarm,
            [alarms](const Intent&, const std::string& userId, const UserContext&) {
                return handleDeleteAlarm(*alarms, userId);
            });
    }

    if (auto flights = services.flights) {
        router.registerHandler(IntentKind::SearchFlights,
            [flights](const Intent& intent, const std::string&, const UserContext& ctx) {
                return handleSearchFlights(*flights, intent, ctx);
            });
    }

    // 🔹 Recognised but not built yet
    router.registerHandler(IntentKind::GetWeather,
        [](const Intent&, const std::string&, const UserContext&) {
            return notImplemented("Weather service coming soon!");
        });
    router.registerHandler(IntentKind::BookFlight,
        [](const Intent&, const std::string&, const UserContext&) {
            return notImplemented("Flight booking coming soon!");
        });
    router.registerHandler(IntentKind::SendMessage,
        [](const Intent&, const std::string&, const UserContext&) {
            return notImplemented("Messaging coming soon!");
        });

    LOG_PHASE("Command table initialised", true);
}
