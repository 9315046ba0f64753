#include "engine/EpisodeRunner.hpp"
#include "engine/ReplayEnvironment.hpp"
#include "core/RuntimeConfig.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace beergame;

int main(int argc, char* argv[]) {
    std::string configPath = "beer_game.json";
    std::string tracePath;
    std::string outputPath;
    std::string logLevel;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--trace" && i + 1 < argc) {
            tracePath = argv[++i];
        }
        else if (arg == "--output" && i + 1 < argc) {
            outputPath = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        }
        else if (arg == "--help") {
            std::cout << "Beer Game Ordering Policy\n"
                << "Usage: beer_game_policy [options] --trace <path>\n"
                << "Options:\n"
                << "  --config <path>         Path to config JSON file (default: beer_game.json)\n"
                << "  --trace <path>          Recorded observation trace to replay (required)\n"
                << "  --output <path>         Write the episode report JSON here (default: stdout)\n"
                << "  --log-level <level>     trace, debug, info, warn or error\n"
                << "  --help                  Show this help\n";
            return 0;
        }
        else {
            std::cerr << "Unknown argument: " << arg << " (see --help)\n";
            return 2;
        }
    }

    if (tracePath.empty()) {
        std::cerr << "Missing required --trace <path> (see --help)\n";
        return 2;
    }

    try {
        RuntimeConfig cfg = RuntimeConfig::loadFromFile(configPath);
        if (!logLevel.empty()) {
            cfg.logging.level = logLevel;
        }
        Logger::init(cfg.logging.file, cfg.logging.level, cfg.logging.console);

        Logger::info("=== Beer Game Ordering Policy ===");
        Logger::info("Config: {}", configPath);
        Logger::info("Trace: {}", tracePath);

        auto env = ReplayEnvironment::fromFile(tracePath, cfg.chain.orderCeiling, cfg.episode.maxPeriods);
        EpisodeRunner runner(env, &cfg);
        EpisodeReport report = runner.runEpisode();

        for (const auto& s : report.agents) {
            Logger::info("{:<12} lead={:.1f} orders={} mean={:.2f} std={:.2f} bullwhip={:.2f}",
                s.name, s.leadTime, s.decisions, s.meanOrder, s.orderStd, s.bullwhipRatio);
        }

        if (outputPath.empty()) {
            std::cout << report.toJson().dump(2) << std::endl;
        }
        else {
            std::ofstream out(outputPath);
            if (!out.is_open()) {
                throw std::runtime_error("Could not open output file: " + outputPath);
            }
            out << report.toJson().dump(2) << '\n';
            Logger::info("Report written to {}", outputPath);
        }
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
