#pragma once

#include <map>
#include <memory>
#include <stdexcept>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/decision_extractor.hpp"
#include "core/domain.hpp"
#include "core/graph_builder.hpp"
#include "core/greedy_solver.hpp"
#include "core/min_cost_flow_solver.hpp"
#include "core/planner_config.hpp"

// Rolling-horizon loop, one call per simulated hour. Only the flight table
// survives between cycles; every plan is rebuilt from scratch.
class PlanningController
{
    PlannerConfig config_;
    AirportMap airports_;
    AircraftTypeMap aircraft_types_;
    std::map<FlightId, Flight> flights_{};
    GraphBuilder builder_;
    std::unique_ptr<FlowSolver> exact_solver_;
    std::unique_ptr<FlowSolver> fallback_solver_;
    Hour last_hour_{};
    bool planned_any_{false};

    void validateHub_() const
    {
        int hubs = 0;
        for (auto const& [_, airport] : airports_) hubs += airport.is_hub ? 1 : 0;
        if (hubs != 1)
        {
            logger_->error("Expected exactly one hub airport, found {}.", hubs);
            throw std::invalid_argument("Expected exactly one hub airport, found " + std::to_string(hubs) + ".");
        }
    }

    void validateAirports_() const
    {
        for (auto const& [code, airport] : airports_)
        {
            auto problem = airportProblem(airport);
            if (!problem.empty())
            {
                logger_->error("Airport {}: {}.", code, problem);
                throw std::invalid_argument("Airport " + code + ": " + problem + ".");
            }
        }
    }

    void pruneDeparted_(Hour hour)
    {
        size_t pruned = 0;
        for (auto it = flights_.begin(); it != flights_.end();)
        {
            if (it->second.departure_hour < hour)
            {
                it = flights_.erase(it);
                ++pruned;
            }
            else
                ++it;
        }
        if (pruned > 0)
            logger_->debug("Pruned {} departed flights, {} still known.", pruned, flights_.size());
    }

    bool verify_(Graph const& graph, Solution const& solution, std::string const& solver_name) const
    {
        if (!config_.verify_solutions)
            return true;
        auto violations = checkFlow(graph, solution.flow);
        if (violations.empty())
            return true;

        logger_->error("{} solution violates {} flow invariants.", solver_name, violations.size());
        for (size_t i = 0; i < violations.size() && i < 10; ++i) logger_->error("  {}", violations[i]);
        return false;
    }

    Solution runSolver_(FlowSolver& solver, Graph const& graph) const
    {
        try
        {
            return solver.solve(graph);
        }
        catch (std::exception const& e)
        {
            logger_->error("{} solver threw: {}", solver.name(), e.what());
            Solution failed;
            failed.status = SolveStatus::ERROR;
            return failed;
        }
    }

    Solution solve_(Graph const& graph, std::string& solver_name) const
    {
        solver_name = exact_solver_->name();
        Solution solution = runSolver_(*exact_solver_, graph);
        if (solution.usable() && verify_(graph, solution, solver_name))
            return solution;

        logger_->warn("{} solver returned {}; falling back to {}.",
                      solver_name,
                      statusName(solution.status),
                      fallback_solver_->name());

        solver_name = fallback_solver_->name();
        solution = runSolver_(*fallback_solver_, graph);
        if (solution.usable() && !verify_(graph, solution, solver_name))
        {
            Solution failed;
            failed.status = SolveStatus::ERROR;
            return failed;
        }
        return solution;
    }

   public:
    PlanningController(PlannerConfig config,
                       AirportMap airports,
                       AircraftTypeMap aircraft_types,
                       std::vector<Flight> const& flights = {})
        : config_(std::move(config)),
          airports_(std::move(airports)),
          aircraft_types_(std::move(aircraft_types)),
          builder_(config_)
    {
        config_.validate();
        validateHub_();
        validateAirports_();

        MinCostFlowOptions options;
        options.time_limit_seconds = config_.solver_time_limit_seconds;
        options.accept_incumbent_on_timeout = config_.accept_incumbent_on_timeout;
        options.parallel = config_.parallel_kit_solve;
        exact_solver_ = std::make_unique<MinCostFlowSolver>(options);
        fallback_solver_ = std::make_unique<GreedySolver>();

        for (auto const& flight : flights) flights_[flight.id] = flight;
        logger_->info("Planner ready: {} airports, {} aircraft types, {} flights, horizon {} h.",
                      airports_.size(),
                      aircraft_types_.size(),
                      flights_.size(),
                      config_.horizon_hours);
    }

    void setExactSolver(std::unique_ptr<FlowSolver> solver) { exact_solver_ = std::move(solver); }

    PlannerConfig const& config() const { return config_; }
    AircraftTypeMap const& aircraftTypes() const { return aircraft_types_; }

    std::vector<Flight> knownFlights() const
    {
        std::vector<Flight> flights;
        flights.reserve(flights_.size());
        for (auto const& [_, flight] : flights_) flights.push_back(flight);
        return flights;
    }

    Flight const* flight(FlightId const& id) const
    {
        auto it = flights_.find(id);
        return it == flights_.end() ? nullptr : &it->second;
    }

    void ingest(std::vector<FlightEvent> const& events)
    {
        for (auto const& event : events)
        {
            auto const& incoming = event.flight;
            if (incoming.id.empty())
            {
                logger_->warn("{} event without flight id ignored.", flightStatusName(event.type));
                continue;
            }

            auto it = flights_.find(incoming.id);
            switch (event.type)
            {
                case FlightStatus::SCHEDULED:
                    if (it != flights_.end() && !it->second.isForecast())
                    {
                        // Keep confirmed load data, take the new timetable.
                        auto& known = it->second;
                        known.departure_hour = incoming.departure_hour;
                        known.arrival_hour = incoming.arrival_hour;
                        known.distance = incoming.distance;
                    }
                    else
                    {
                        flights_[incoming.id] = incoming;
                        flights_[incoming.id].status = FlightStatus::SCHEDULED;
                    }
                    break;
                case FlightStatus::CHECKED_IN:
                    if (it == flights_.end())
                    {
                        flights_[incoming.id] = incoming;
                    }
                    else
                    {
                        it->second.passengers = incoming.passengers;
                        it->second.aircraft_type = incoming.aircraft_type;
                    }
                    flights_[incoming.id].status = FlightStatus::CHECKED_IN;
                    break;
                case FlightStatus::LANDED:
                    if (it != flights_.end())
                        flights_.erase(it);
                    else
                        logger_->debug("LANDED event for unknown flight {}.", incoming.id);
                    break;
            }
        }
    }

    Decision runCycle(Hour hour, std::vector<FlightEvent> const& events, InventorySnapshot const& inventory)
    {
        if (planned_any_ && hour <= last_hour_)
        {
            logger_->error("Planning cycle for hour {} requested after hour {}.", hour, last_hour_);
            throw std::logic_error("Planning hours must strictly increase.");
        }
        last_hour_ = hour;
        planned_any_ = true;

        ingest(events);
        pruneDeparted_(hour);

        try
        {
            Graph graph = builder_.build(airports_, aircraft_types_, knownFlights(), inventory, hour);

            std::string solver_name;
            Solution solution = solve_(graph, solver_name);

            Decision decision = DecisionExtractor::extract(graph, solution, hour);
            decision.solver = solver_name;
            return decision;
        }
        catch (std::exception const& e)
        {
            logger_->error("Planning cycle for hour {} failed: {}", hour, e.what());
            Decision decision;
            decision.hour = hour;
            decision.status = SolveStatus::ERROR;
            return decision;
        }
    }
};
