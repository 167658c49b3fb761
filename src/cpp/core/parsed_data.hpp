#pragma once
#include <map>
#include <vector>

#include "core/domain.hpp"
#include "core/inventory_ledger.hpp"
#include "core/planner_config.hpp"
#include "core/planning_controller.hpp"

class ScenarioData
{
   public:
    PlannerConfig config;
    AirportMap airports;
    AircraftTypeMap aircraft_types;
    std::vector<Flight> flights;  // known before the first cycle
    std::map<Hour, std::vector<FlightEvent>> events;

    Hour start_hour{0};
    Hour end_hour{0};

    std::vector<FlightEvent> eventsAt(Hour hour) const
    {
        auto it = events.find(hour);
        return it == events.end() ? std::vector<FlightEvent>{} : it->second;
    }

    PlanningController makeController() const { return PlanningController(config, airports, aircraft_types, flights); }

    InventoryLedger initialLedger() const { return InventoryLedger(config, airports); }
};
