#pragma once

#include <stdexcept>
#include <string>

#include "app/spdlog_tmp.hpp"
#include "core/kit_types.hpp"

struct KitConfig
{
    Cost unit_cost{};
    double unit_weight{};
    Hour lead_time{};
};

// Every business constant the builder and solvers use. Defaults follow the
// most complete constant table seen in earlier versions of the planner.
struct PlannerConfig
{
    KitArray<KitConfig> kits{{
        {500.0, 5.0, 48},  // FIRST
        {200.0, 3.0, 36},  // BUSINESS
        {100.0, 2.0, 24},  // PREMIUM_ECONOMY
        {50.0, 1.0, 12},   // ECONOMY
    }};

    Hour horizon_hours{72};
    Cost holding_cost{0.0};
    double fuel_cost_per_km_kg{0.5};
    double unfulfilled_penalty_factor{10.0};
    double penalty_safety_factor{2.0};
    Flow max_order_quantity{1000};
    Cost discard_cost{0.0};

    Flow default_storage_capacity{1000};
    Cost default_loading_cost{5.0};
    Cost default_processing_cost{10.0};
    Hour default_processing_time{2};

    double solver_time_limit_seconds{30.0};
    bool accept_incumbent_on_timeout{false};
    bool parallel_kit_solve{true};
    bool verify_solutions{true};

    std::string log_level{"info"};

    KitConfig const& kit(KitType kit_type) const { return kits[kitIndex(kit_type)]; }

    Cost fuelCost(double distance, KitType kit_type) const
    {
        return distance * fuel_cost_per_km_kg * kit(kit_type).unit_weight;
    }

    void validate() const
    {
        auto fail = [](std::string const& message)
        {
            logger_->error("Invalid planner configuration: {}", message);
            throw std::invalid_argument("Invalid planner configuration: " + message);
        };

        if (horizon_hours < 1)
            fail("horizon_hours must be at least 1");
        for (KitType kit_type : ALL_KIT_TYPES)
        {
            auto const& k = kit(kit_type);
            if (k.unit_cost < 0 || k.unit_weight < 0 || k.lead_time < 0)
                fail("kit constants for " + kitName(kit_type) + " must be non-negative");
        }
        if (holding_cost < 0 || discard_cost < 0 || fuel_cost_per_km_kg < 0)
            fail("holding, discard and fuel costs must be non-negative");
        if (unfulfilled_penalty_factor < 0)
            fail("unfulfilled_penalty_factor must be non-negative");
        if (penalty_safety_factor <= 1.0)
            fail("penalty_safety_factor must exceed 1");
        if (max_order_quantity < 0)
            fail("max_order_quantity must be non-negative");
        if (default_storage_capacity < 0 || default_loading_cost < 0 || default_processing_cost < 0 ||
            default_processing_time < 0)
            fail("airport defaults must be non-negative");
        if (solver_time_limit_seconds < 0)
            fail("solver_time_limit_seconds must be non-negative");
    }
};
