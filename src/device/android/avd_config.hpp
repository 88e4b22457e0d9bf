/*
 * avd_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Editing of an AVD's config.ini

**************************************************/

#ifndef DEVPREVIEW_DEVICE_ANDROID_AVD_CONFIG_HPP
#define DEVPREVIEW_DEVICE_ANDROID_AVD_CONFIG_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "common/preview_result.hpp"

namespace devpreview::device::android {

using ConfigOverrides = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Settings applied to every AVD this tool creates
 */
[[nodiscard]] auto defaultAvdOverrides() -> ConfigOverrides;

/**
 * @brief Rewrite `key=value` lines of a config.ini.
 *
 * Existing keys are replaced in place, missing keys are appended, and every
 * other line is kept as is.
 *
 * @return Success, or DeviceCreation if the file cannot be read or written
 */
[[nodiscard]] auto patchAvdConfig(const std::filesystem::path& configIni,
                                  const ConfigOverrides& overrides)
    -> PreviewVoidResult;

}  // namespace devpreview::device::android

#endif  // DEVPREVIEW_DEVICE_ANDROID_AVD_CONFIG_HPP
