/**
 * @file main.cpp
 * @brief PlanScope command-line entry point.
 *
 * Wires the host pieces around the analysis core:
 *   Config → Logger → TaskLoader → PlanningEngine → ReportWriter
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/planning_engine.hpp"
#include "io/task_loader.hpp"
#include "report/report_writer.hpp"
#include "telemetry/log_sinks.hpp"
#include "workload/plan_generator.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace plan_scope;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitLoadFailure = 1;
constexpr int kExitUsage = 2;

const std::filesystem::path kDefaultConfigPath = "config/default.toml";

struct CLIArgs {
    std::optional<std::filesystem::path> plan_path;
    std::optional<std::filesystem::path> config_path;
    std::optional<ReportFormat> format;
    std::vector<std::string> sections;
    bool demo_mode = false;
    bool show_help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: plan_scope --plan <file.toml> [OPTIONS]\n"
        << "  --plan <path>       Task snapshot to analyze (TOML)\n"
        << "  --config <path>     Configuration file (default: config/default.toml if present)\n"
        << "  --format <fmt>      Report format: text or json\n"
        << "  --section <name>    Report section to include; repeatable\n"
        << "                      (risks, graph, decompositions, schedule, health)\n"
        << "  --demo              Analyze a generated diamond plan instead of a file\n"
        << "  --help, -h          Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&]() { return i + 1 < argc; };

        if (arg == "--plan" && needs_value()) {
            args.plan_path = argv[++i];
        } else if (arg == "--config" && needs_value()) {
            args.config_path = argv[++i];
        } else if (arg == "--format" && needs_value()) {
            std::string fmt = argv[++i];
            if (fmt == "text") {
                args.format = ReportFormat::Text;
            } else if (fmt == "json") {
                args.format = ReportFormat::Json;
            } else {
                return make_error<CLIArgs>(ErrorCode::InvalidInput, "Unknown format: " + fmt);
            }
        } else if (arg == "--section" && needs_value()) {
            args.sections.emplace_back(argv[++i]);
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        } else {
            return make_error<CLIArgs>(ErrorCode::InvalidInput, "Unrecognized or incomplete option: " + arg);
        }
    }

    if (!args.show_help && !args.demo_mode && !args.plan_path) {
        return make_error<CLIArgs>(ErrorCode::InvalidInput, "--plan <file> or --demo is required");
    }
    return args;
}

/**
 * @brief A small diamond plan with one oversized task, so every report
 *        section has something to show.
 */
PlanDocument demo_plan() {
    PlanDocument doc;
    doc.name = "Demo diamond";
    doc.tasks = PlanGenerator::diamond(2, 3, 30);
    if (doc.tasks.size() > 1) {
        doc.tasks[1].title = "Implement payment adapter";
        doc.tasks[1].estimated_minutes = 150;
        doc.tasks[1].priority = TaskPriority::P1;
    }
    return doc;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << "plan_scope: " << args_result.error().message << "\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    const auto& args = *args_result;
    if (args.show_help) {
        print_usage(std::cout);
        return kExitOk;
    }

    // ── Configuration ────────────────────────
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << "\n";
            return kExitLoadFailure;
        }
        config = std::move(loaded).value();
    } else if (std::filesystem::exists(kDefaultConfigPath)) {
        auto loaded = load_config(kDefaultConfigPath);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << "\n"
                      << "Using default configuration.\n";
        } else {
            config = std::move(loaded).value();
        }
    }

    // CLI overrides
    if (args.format) config.report.format = *args.format;
    if (!args.sections.empty()) config.report.sections = args.sections;

    auto sections = parse_sections(config.report.sections);
    if (!sections) {
        std::cerr << "plan_scope: " << sections.error().message << "\n";
        return kExitUsage;
    }

    // ── Logger ───────────────────────────────
    Logger logger(make_log_sink(config.log, "plan_scope"), config.log.level);
    logger.debug("Log sink: " + std::string{to_string(config.log.sink)});

    // ── Plan ─────────────────────────────────
    PlanDocument plan;
    if (args.demo_mode) {
        plan = demo_plan();
        logger.info("Demo mode: generated " + std::to_string(plan.tasks.size()) + " tasks");
    } else {
        auto loaded = load_plan_file(*args.plan_path);
        if (!loaded) {
            logger.error("Plan load failed: " + loaded.error().message);
            logger.flush();
            std::cerr << "Failed to load plan: " << loaded.error().message << "\n";
            return kExitLoadFailure;
        }
        plan = std::move(loaded).value();
    }

    // ── Analysis ─────────────────────────────
    PlanningEngine engine(logger);
    auto report = engine.analyze(plan.tasks, plan.name);

    if (config.report.format == ReportFormat::Json) {
        std::cout << render_json(report, *sections) << "\n";
    } else {
        std::cout << render_text(report, *sections);
    }

    logger.flush();
    return kExitOk;
}
