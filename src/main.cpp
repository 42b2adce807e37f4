#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "../engine/core/Logger.h"
#include "../tower/content/Content.h"
#include "../tower/meta/SmokeRun.h"

namespace {

void printUsage() {
    std::cout << "usage: isotower_smoke [--content FILE] [--grid N] [--seed S] [--waves N]\n"
                 "                      [--max-ticks N] [--log-level debug|info|warn|error]\n";
}

}  // namespace

int main(int argc, char** argv) {
    // Keep stdout for the JSON report.
    Engine::Logger::setSink([](Engine::LogLevel, const std::string& line) { std::cerr << line << '\n'; });

    Tower::Meta::SmokeOptions options{};
    std::string contentPath;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            }
            if (i + 1 >= argc) {
                Engine::logError("Missing value for " + arg);
                printUsage();
                return 2;
            }
            const std::string value = argv[++i];
            if (arg == "--content") {
                contentPath = value;
            } else if (arg == "--grid") {
                options.gridSize = std::stoi(value);
            } else if (arg == "--seed") {
                options.seed = static_cast<std::uint64_t>(std::stoull(value));
            } else if (arg == "--waves") {
                options.waves = std::stoi(value);
            } else if (arg == "--max-ticks") {
                options.maxTicksPerWave = std::stoi(value);
            } else if (arg == "--log-level") {
                Engine::LogLevel level{};
                if (!Engine::Logger::parseLevel(value, level)) {
                    Engine::logError("Unknown log level: " + value);
                    return 2;
                }
                Engine::Logger::setMinLevel(level);
            } else {
                Engine::logError("Unknown option: " + arg);
                printUsage();
                return 2;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends throw invalid_argument / out_of_range.
        Engine::logError(std::string("Bad numeric argument: ") + e.what());
        return 2;
    }

    if (options.gridSize < 16) {
        Engine::logError("Grid must be at least 16 tiles for the smoke layout");
        return 2;
    }

    Tower::Content content = Tower::defaultContent();
    if (!contentPath.empty() && !Tower::loadContentFile(contentPath, content)) {
        return 2;
    }

    const Tower::Meta::SmokeReport report = Tower::Meta::runSmoke(options, content);
    std::cout << report.summary.dump(2) << std::endl;
    return report.ok ? 0 : 1;
}
