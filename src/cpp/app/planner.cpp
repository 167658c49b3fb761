#include <iostream>
#include <string>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/decision_extractor.hpp"
#include "core/inventory_ledger.hpp"
#include "core/parsed_data.hpp"
#include "core/parser.hpp"
#include "core/planning_controller.hpp"

int main(int argc, char* argv[])
{
    if (argc != 3 && argc != 4)
    {
        std::cerr << "Usage: planner <scenario_json_path> <decisions_output_path> [log_level]" << std::endl;
        return 1;
    }

    initLogger(argc == 4 ? argv[3] : "info");

    std::string input_path = argv[1];
    std::string output_path = argv[2];

    try
    {
        auto data = ScenarioParser::parse_from_json(input_path);
        if (argc != 4)
            initLogger(data.config.log_level);
        std::cout << "Parsed successfully from: " << input_path << std::endl;

        auto controller = data.makeController();
        auto ledger = data.initialLedger();

        std::vector<Decision> decisions;
        for (Hour hour = data.start_hour; hour < data.end_hour; ++hour)
        {
            auto snapshot = ledger.snapshot(hour);
            auto decision = controller.runCycle(hour, data.eventsAt(hour), snapshot);
            ledger.apply(decision);
            decisions.push_back(std::move(decision));
        }

        Cost planned = 0;
        size_t fallbacks = 0;
        for (auto const& decision : decisions)
        {
            planned += decision.planned_cost;
            fallbacks += decision.status == SolveStatus::GREEDY || decision.status == SolveStatus::ERROR ? 1 : 0;
        }
        logger_->info("Planned {} hours, {} degraded; sum of planned costs {:.2f}.",
                      decisions.size(),
                      fallbacks,
                      planned);

        ScenarioParser::serialize_to_json(decisions, output_path);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Planning failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
