#pragma once

#include "core/log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <string>

namespace cirrus {
    using json = nlohmann::json;

    inline std::optional<json> loadJsonConfig(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            log::error("Config", "failed to open config file: ", path);
            return std::nullopt;
        }
        try {
            json j;
            file >> j;
            return j;
        } catch (const json::exception& e) {
            log::error("Config", "failed to parse JSON from ", path, ": ", e.what());
            return std::nullopt;
        }
    }
}
