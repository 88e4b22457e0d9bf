/*
 * avd_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "avd_config.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include "common/string_utils.hpp"

namespace devpreview::device::android {

auto defaultAvdOverrides() -> ConfigOverrides {
    return {{"hw.keyboard", "yes"},
            {"hw.gpu.enabled", "yes"},
            {"hw.gpu.mode", "auto"}};
}

auto patchAvdConfig(const std::filesystem::path& configIni,
                    const ConfigOverrides& overrides) -> PreviewVoidResult {
    std::ifstream in(configIni);
    if (!in.is_open()) {
        return failure(PreviewErrorCode::DeviceCreation,
                       "Cannot read AVD configuration: " + configIni.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();
    const auto content = buffer.str();

    std::vector<std::string> lines;
    std::set<std::string> applied;
    for (auto raw : utils::splitLines(content)) {
        std::string line(raw);
        auto eq = raw.find('=');
        if (eq != std::string_view::npos) {
            auto key = std::string(utils::trim(raw.substr(0, eq)));
            for (const auto& [name, value] : overrides) {
                if (name == key) {
                    line = name + "=" + value;
                    applied.insert(name);
                    break;
                }
            }
        }
        lines.push_back(std::move(line));
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    for (const auto& [name, value] : overrides) {
        if (!applied.contains(name)) {
            lines.push_back(name + "=" + value);
        }
    }

    std::ofstream out(configIni, std::ios::trunc);
    if (!out.is_open()) {
        return failure(PreviewErrorCode::DeviceCreation,
                       "Cannot write AVD configuration: " +
                           configIni.string());
    }
    for (const auto& line : lines) {
        out << line << '\n';
    }
    if (!out) {
        return failure(PreviewErrorCode::DeviceCreation,
                       "Failed writing AVD configuration: " +
                           configIni.string());
    }
    return success();
}

}  // namespace devpreview::device::android
