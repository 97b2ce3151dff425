#include "app/Simulation.hpp"
#include "engine/Log.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [config.json] [key=value ...]\n"
              << "  e.g. " << argv0 << " config.json render.mode=window simulation.time_step=120\n";
}

int main(int argc, char** argv) {
    std::string configPath = "config.json";
    std::vector<std::string> overrides;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        std::string arg = argv[i];
        if (arg.find('=') != std::string::npos) {
            overrides.push_back(arg);
        } else {
            configPath = arg;
        }
    }

    orrery::Simulation simulation;

    if (!simulation.init(configPath, overrides)) {
        simulation.shutdown();
        orrery::Log::shutdown();
        return 1;
    }

    bool ok = simulation.run();
    simulation.shutdown();
    orrery::Log::shutdown();

    return ok ? 0 : 1;
}
