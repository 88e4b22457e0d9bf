/*
 * simulator_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Parsers for `xcrun simctl list --json` output

*************************************************/

#include "simulator_parser.hpp"

#include <algorithm>
#include <regex>

#include <nlohmann/json.hpp>

namespace devpreview::parser {

namespace {

auto parseJson(std::string_view text) -> PreviewResult<nlohmann::json> {
    try {
        auto json = nlohmann::json::parse(text);
        if (!json.is_object()) {
            return failure(PreviewErrorCode::ParseError,
                           "Expected a JSON object from simctl");
        }
        return json;
    } catch (const nlohmann::json::parse_error& e) {
        return failure(PreviewErrorCode::ParseError,
                       "Malformed simctl JSON output", e.what());
    }
}

auto escapeRegex(std::string_view text) -> std::string {
    static const std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : text) {
        if (kSpecial.find(c) != std::string_view::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

auto buildRuntimeMatcher(const std::vector<std::string>& supportedRuntimes)
    -> std::regex {
    std::string alternatives;
    for (const auto& runtime : supportedRuntimes) {
        if (!alternatives.empty()) {
            alternatives += '|';
        }
        alternatives += escapeRegex(runtime);
    }
    return std::regex(R"(\.SimRuntime\.()" + alternatives + ")");
}

auto stringField(const nlohmann::json& object, const char* key)
    -> std::string {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

auto SimulatorRuntime::shortIdentifier() const -> std::string {
    std::string_view id = identifier;
    if (id.starts_with(kSimRuntimePrefix)) {
        id.remove_prefix(kSimRuntimePrefix.size());
    }
    return std::string(id);
}

auto runtimeLabelFromIdentifier(std::string_view identifier) -> std::string {
    std::string label(identifier);
    if (auto pos = label.find(kSimRuntimePrefix); pos != std::string::npos) {
        label.erase(pos, kSimRuntimePrefix.size());
    }
    if (auto dash = label.find('-'); dash != std::string::npos) {
        label[dash] = ' ';
    }
    std::replace(label.begin(), label.end(), '-', '.');
    return label;
}

auto parseSimulatorDevices(std::string_view json,
                           const std::vector<std::string>& supportedRuntimes)
    -> PreviewResult<std::vector<device::DeviceDescriptor>> {
    auto root = parseJson(json);
    if (!root) {
        return std::unexpected(root.error());
    }

    std::vector<device::DeviceDescriptor> devices;
    auto devicesIt = root->find("devices");
    if (devicesIt == root->end() || devicesIt->is_null()) {
        return devices;
    }
    if (!devicesIt->is_object()) {
        return failure(PreviewErrorCode::ParseError,
                       "\"devices\" is not an object keyed by runtime");
    }

    if (supportedRuntimes.empty()) {
        return devices;
    }

    auto matcher = buildRuntimeMatcher(supportedRuntimes);
    std::vector<std::string> runtimes;
    for (const auto& [key, value] : devicesIt->items()) {
        if (!key.empty() && std::regex_search(key, matcher)) {
            runtimes.push_back(key);
        }
    }
    // Plain reverse lexical order, not a semantic version sort.
    std::sort(runtimes.begin(), runtimes.end(), std::greater<>());

    for (const auto& runtimeId : runtimes) {
        const auto& entries = (*devicesIt)[runtimeId];
        if (!entries.is_array()) {
            return failure(PreviewErrorCode::ParseError,
                           "Device list for " + runtimeId + " is not an array");
        }
        auto label = runtimeLabelFromIdentifier(runtimeId);
        for (const auto& entry : entries) {
            if (!entry.is_object()) {
                continue;
            }
            device::DeviceDescriptor descriptor;
            descriptor.name = stringField(entry, "name");
            descriptor.identifier = stringField(entry, "udid");
            descriptor.state =
                device::deviceStateFromString(stringField(entry, "state"));
            descriptor.runtimeLabel = label;
            descriptor.isAvailable = entry.value("isAvailable", true);
            devices.push_back(std::move(descriptor));
        }
    }

    return devices;
}

auto parseSimulatorRuntimes(std::string_view json)
    -> PreviewResult<std::vector<SimulatorRuntime>> {
    auto root = parseJson(json);
    if (!root) {
        return std::unexpected(root.error());
    }

    std::vector<SimulatorRuntime> runtimes;
    auto it = root->find("runtimes");
    if (it == root->end() || !it->is_array()) {
        return runtimes;
    }

    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            continue;
        }
        SimulatorRuntime runtime;
        runtime.identifier = stringField(entry, "identifier");
        runtime.name = stringField(entry, "name");
        runtime.version = stringField(entry, "version");
        runtime.platform = stringField(entry, "platform");
        if (runtime.platform.empty()) {
            runtime.platform = runtime.name.substr(0, runtime.name.find(' '));
        }
        runtime.isAvailable = entry.value("isAvailable", false);
        runtimes.push_back(std::move(runtime));
    }
    return runtimes;
}

auto parseSimulatorDeviceTypes(std::string_view json)
    -> PreviewResult<std::vector<SimulatorDeviceType>> {
    auto root = parseJson(json);
    if (!root) {
        return std::unexpected(root.error());
    }

    std::vector<SimulatorDeviceType> deviceTypes;
    auto it = root->find("devicetypes");
    if (it == root->end() || !it->is_array()) {
        return deviceTypes;
    }

    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            continue;
        }
        deviceTypes.push_back({stringField(entry, "identifier"),
                               stringField(entry, "name"),
                               stringField(entry, "productFamily")});
    }
    return deviceTypes;
}

}  // namespace devpreview::parser
