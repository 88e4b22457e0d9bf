/*
 * device_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device descriptors shared by the simulator and emulator layers

**************************************************/

#ifndef DEVPREVIEW_DEVICE_DEVICE_TYPES_HPP
#define DEVPREVIEW_DEVICE_DEVICE_TYPES_HPP

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "common/string_utils.hpp"

namespace devpreview::device {

/**
 * @brief Lifecycle state reported by the platform tooling
 */
enum class DeviceState { Unknown, Creating, Shutdown, Booting, Booted };

[[nodiscard]] inline auto deviceStateToString(DeviceState state)
    -> std::string {
    switch (state) {
        case DeviceState::Creating:
            return "Creating";
        case DeviceState::Shutdown:
            return "Shutdown";
        case DeviceState::Booting:
            return "Booting";
        case DeviceState::Booted:
            return "Booted";
        case DeviceState::Unknown:
        default:
            return "Unknown";
    }
}

[[nodiscard]] inline auto deviceStateFromString(std::string_view state)
    -> DeviceState {
    auto value = utils::trim(state);
    if (utils::iequals(value, "Booted")) return DeviceState::Booted;
    if (utils::iequals(value, "Shutdown")) return DeviceState::Shutdown;
    if (utils::iequals(value, "Booting")) return DeviceState::Booting;
    if (utils::iequals(value, "Creating")) return DeviceState::Creating;
    return DeviceState::Unknown;
}

/**
 * @brief A simulator or emulator as seen by the platform tooling
 *
 * Mirrors external OS state; instances are snapshots owned by the caller
 * that parsed them.
 */
struct DeviceDescriptor {
    std::string name;
    std::string identifier;  ///< Simulator UDID or AVD name
    DeviceState state{DeviceState::Unknown};
    std::string runtimeLabel;  ///< e.g. "iOS 17.5" or "Android 12.0 (S)"
    bool isAvailable{true};

    [[nodiscard]] auto toString() const -> std::string {
        return name + ", " + runtimeLabel;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"name", name},
                {"identifier", identifier},
                {"state", deviceStateToString(state)},
                {"runtime", runtimeLabel},
                {"isAvailable", isAvailable}};
    }
};

}  // namespace devpreview::device

#endif  // DEVPREVIEW_DEVICE_DEVICE_TYPES_HPP
