#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/simulator_builder.hpp"
#include "fdm/jsbsim_model.hpp"
#include <cmath>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr char kTag[] = "cirrus";

enum ExitCode {
    kExitOk = 0,
    kExitConfig = 1,
    kExitRun = 2,
    kExitFault = 3
};

void printUsage() {
    std::cout << "usage: cirrus [--config path] [--seconds N] [--verbose]\n";
}

void printNested(const std::exception& e) {
    std::cerr << "  " << e.what() << "\n";
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        printNested(inner);
    } catch (...) {
        std::cerr << "  (non-standard exception)\n";
    }
}

}

int main(int argc, char** argv) {
    std::string configPath;
    double seconds = 10.0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--seconds" && i + 1 < argc) {
            const char* text = argv[++i];
            char* end = nullptr;
            seconds = std::strtod(text, &end);
            if (end == text || *end != '\0' || !std::isfinite(seconds)) {
                cirrus::log::error(kTag, "invalid --seconds value: ", text);
                printUsage();
                return kExitConfig;
            }
        } else if (arg == "--verbose") {
            cirrus::log::setLevel(cirrus::log::Level::Debug);
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return kExitOk;
        } else {
            printUsage();
            return kExitConfig;
        }
    }

    std::unique_ptr<cirrus::Simulator> simulator;
    try {
        cirrus::SimulatorConfig config;
        if (!configPath.empty()) {
            config = cirrus::SimulatorConfig::load(configPath);
        }

        cirrus::SimulatorBuilder builder(config, cirrus::JsbsimModel::factory());
        simulator = builder.createSimulator();
    } catch (const cirrus::ConfigError& e) {
        cirrus::log::error(kTag, e.what());
        return kExitConfig;
    } catch (const cirrus::SimulationError& e) {
        cirrus::log::error(kTag, "flight model fault while building the simulator");
        printNested(e);
        return kExitFault;
    } catch (const std::exception& e) {
        cirrus::log::error(kTag, "failed to build the simulator: ", e.what());
        return kExitConfig;
    }

    if (!simulator) {
        cirrus::log::error(kTag, "failed to create the simulator");
        return kExitConfig;
    }

    cirrus::log::info(kTag, "running for ", seconds, " seconds");

    bool ok = false;
    try {
        ok = simulator->runFor(seconds);
    } catch (const cirrus::SimulationError& e) {
        cirrus::log::error(kTag, "simulation aborted");
        printNested(e);
        return kExitFault;
    }

    simulator->printState(std::cout);

    if (!ok) {
        return kExitRun;
    }
    if (simulator->crashed()) {
        cirrus::log::warn(kTag, "the aircraft crashed during the run");
    }
    return kExitOk;
}
