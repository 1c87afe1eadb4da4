#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"
#include "atom/utils/argsview.hpp"

#include "config/plan_config.hpp"
#include "ephemeris/tabulated_geometry.hpp"
#include "exception/exception.hpp"
#include "logging/logging.hpp"
#include "planner/observation_planner.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

constexpr int EXIT_PLANNING_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

struct CommandLine {
    fs::path config;
    fs::path geometry;
    fs::path output;
    bool json = false;
};

void logReport(const tessera::planner::PlanReport& report) {
    std::istringstream lines(report.summary());
    for (std::string line; std::getline(lines, line);) {
        spdlog::info("{}", line);
    }
}

void writeOutput(const CommandLine& cli, const std::string& text) {
    if (cli.output.empty()) {
        std::cout << text;
        return;
    }
    if (cli.output.has_parent_path()) {
        fs::create_directories(cli.output.parent_path());
    }
    std::ofstream file(cli.output);
    if (!file) {
        THROW_INVALID_CONFIGURATION("Cannot open output file: ",
                                    cli.output.string());
    }
    file << text;
    if (!file) {
        THROW_INVALID_CONFIGURATION("Failed writing output file: ",
                                    cli.output.string());
    }
    spdlog::info("Wrote {}", cli.output.string());
}

int run(const CommandLine& cli) {
    const auto plan = tessera::config::loadPlanConfig(cli.config);
    tessera::logging::setupLogging(plan.logging);

    auto geometry = std::make_shared<const tessera::ephemeris::TabulatedGeometry>(
        tessera::ephemeris::TabulatedGeometry::fromFile(cli.geometry));
    const tessera::planner::ObservationPlanner planner(geometry, plan.instrument);
    const auto result = planner.plan(plan.observation);
    logReport(result.report);

    if (cli.json) {
        const nlohmann::json document = {
            {"plan", plan.toJson()},
            {"observation", result.observation->toJson()},
            {"report", result.report.toJson()}};
        writeOutput(cli, document.dump(4) + "\n");
    } else {
        writeOutput(cli, result.ptr);
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    atom::utils::ArgumentParser program("tessera"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to the plan file (JSON or JSON5)",
                        {"c"});
    program.addArgument("geometry",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Path to the tabulated geometry file", {"g"});
    program.addArgument("output", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Write the result here instead of stdout",
                        {"o"});
    program.addArgument("json", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Print the observation as JSON", {"j"});

    program.addDescription("Tessera mosaic and scan planner:");
    program.addEpilog("Exit status: 0 on success, 1 on planning errors, "
                      "2 on usage errors.");

    CommandLine cli;
    try {
        std::vector<std::string> args(argv, argv + argc);
        program.parse(argc, args);
        cli.config = program.get<std::string>("config").value_or(""s);
        cli.geometry = program.get<std::string>("geometry").value_or(""s);
        cli.output = program.get<std::string>("output").value_or(""s);
        cli.json = program.get<bool>("json").value_or(false);
    } catch (const std::exception& e) {
        spdlog::error("Invalid arguments: {}", e.what());
        return EXIT_USAGE_ERROR;
    }
    if (cli.config.empty() || cli.geometry.empty()) {
        spdlog::error("Both --config and --geometry are required");
        return EXIT_USAGE_ERROR;
    }

    try {
        return run(cli);
    } catch (const atom::error::Exception& e) {
        spdlog::error("Planning failed: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
    }
    return EXIT_PLANNING_ERROR;
}
