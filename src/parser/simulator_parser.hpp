/*
 * simulator_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Parsers for `xcrun simctl list --json` output

*************************************************/

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "common/preview_result.hpp"
#include "device/device_types.hpp"

namespace devpreview::parser {

/**
 * @brief Prefix shared by every CoreSimulator runtime identifier
 */
inline constexpr std::string_view kSimRuntimePrefix =
    "com.apple.CoreSimulator.SimRuntime.";

/**
 * @brief A simulator runtime (OS image) entry
 */
struct SimulatorRuntime {
    std::string identifier;  ///< com.apple.CoreSimulator.SimRuntime.iOS-17-5
    std::string name;        ///< iOS 17.5
    std::string version;     ///< 17.5
    std::string platform;    ///< iOS
    bool isAvailable{false};

    /**
     * @brief Identifier without the CoreSimulator prefix ("iOS-17-5")
     */
    [[nodiscard]] auto shortIdentifier() const -> std::string;
};

/**
 * @brief A simulator hardware profile entry
 */
struct SimulatorDeviceType {
    std::string identifier;  ///< com.apple.CoreSimulator.SimDeviceType.iPhone-15
    std::string name;        ///< iPhone 15
    std::string productFamily;
};

/**
 * @brief Convert a runtime identifier to a human readable label.
 *
 * "com.apple.CoreSimulator.SimRuntime.iOS-13-3-2" becomes "iOS 13.3.2": the
 * prefix is removed, the first '-' becomes a space and the rest become '.'.
 */
[[nodiscard]] auto runtimeLabelFromIdentifier(std::string_view identifier)
    -> std::string;

/**
 * @brief Parse `simctl list --json devices` output.
 *
 * Only runtimes whose key matches `.SimRuntime.(<id>|...)` for an entry of
 * @p supportedRuntimes are kept. Runtime keys are visited in descending
 * lexical order and their devices flattened in that order.
 *
 * @param json Raw JSON text
 * @param supportedRuntimes Runtime ids such as "iOS-17-5"
 * @return Devices, or ParseError for malformed JSON. A missing "devices"
 * key or an empty @p supportedRuntimes yields an empty list.
 */
[[nodiscard]] auto parseSimulatorDevices(
    std::string_view json, const std::vector<std::string>& supportedRuntimes)
    -> PreviewResult<std::vector<device::DeviceDescriptor>>;

/**
 * @brief Parse `simctl list --json runtimes` output
 */
[[nodiscard]] auto parseSimulatorRuntimes(std::string_view json)
    -> PreviewResult<std::vector<SimulatorRuntime>>;

/**
 * @brief Parse `simctl list --json devicetypes` output
 */
[[nodiscard]] auto parseSimulatorDeviceTypes(std::string_view json)
    -> PreviewResult<std::vector<SimulatorDeviceType>>;

}  // namespace devpreview::parser
