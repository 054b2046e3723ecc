#pragma once
#include <memory>

#include "commands/commands_core.hpp"
#include "commands/commands_alarms.hpp"
#include "commands/commands_flights.hpp"

/// Action services the router dispatches into.
struct CommandServices {
    std::shared_ptr<AlarmService> alarms;
    std::shared_ptr<FlightsService> flights;
};

/// Fills the dispatch table:
///   set_alarm, delete_alarm  -> AlarmService
///   search_flights           -> FlightsService
///   get_weather, book_flight, send_message -> "coming soon" placeholders
/// `unknown` gets no handler, so the router answers Unimplemented.
/// Services left null are not registered.
void initCommands(CommandRouter& router, const CommandServices& services);
