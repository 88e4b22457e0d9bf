/*
 * android_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Parsers for Android SDK command line tool output (sdkmanager,
avdmanager, emulator, adb)

*************************************************/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/preview_result.hpp"

namespace devpreview::parser {

/**
 * @brief Kind of SDK package, derived from the first path segment
 */
enum class PackageKind { Platform, SystemImage, BuildTools, Other };

[[nodiscard]] auto packageKindToString(PackageKind kind) -> std::string;

/**
 * @brief One row of the `sdkmanager --list` installed packages table
 */
struct PackageCatalogEntry {
    std::string path;  ///< e.g. system-images;android-30;google_apis;x86_64
    std::string version;
    std::string description;
    std::string installLocation;

    [[nodiscard]] auto kind() const -> PackageKind;

    /**
     * @brief API level or codename ("30", "Tiramisu"); empty when the path
     * carries none
     */
    [[nodiscard]] auto apiLevel() const -> std::string;

    /**
     * @brief System image tag ("google_apis"), system images only
     */
    [[nodiscard]] auto tag() const -> std::string;

    /**
     * @brief System image ABI ("x86_64"), system images only
     */
    [[nodiscard]] auto abi() const -> std::string;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Installed SDK packages, in listing order with unique paths
 */
class PackageCatalog {
public:
    PackageCatalog() = default;
    explicit PackageCatalog(std::vector<PackageCatalogEntry> entries);

    [[nodiscard]] auto entries() const -> const std::vector<PackageCatalogEntry>& {
        return entries_;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return entries_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return entries_.empty();
    }

    [[nodiscard]] auto find(std::string_view path) const
        -> std::optional<PackageCatalogEntry>;

    [[nodiscard]] auto platforms() const -> std::vector<PackageCatalogEntry>;
    [[nodiscard]] auto systemImages() const
        -> std::vector<PackageCatalogEntry>;

private:
    std::vector<PackageCatalogEntry> entries_;
};

/**
 * @brief Parse `sdkmanager --list` output.
 *
 * Rows between the "Installed packages:" header and the "Available
 * Packages:" footer are read as `|` separated columns. A header with no data
 * rows gives an empty catalog.
 *
 * @param text Raw tool output
 * @param requireHeader Fail with FormatError when the installed packages
 * header is missing
 */
[[nodiscard]] auto parsePackageCatalog(std::string_view text,
                                       bool requireHeader = false)
    -> PreviewResult<PackageCatalog>;

/**
 * @brief An entry of `avdmanager list avd`
 */
struct AvdDescriptor {
    std::string name;
    std::string device;
    std::string path;
    std::string target;
    std::string basedOn;  ///< "Android 12.0 (S)"
    std::string tagAbi;   ///< "google_apis/arm64-v8a"
    std::string skin;
    std::string sdcard;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Parse `avdmanager list avd` output into one descriptor per block
 */
[[nodiscard]] auto parseAvdList(std::string_view text)
    -> std::vector<AvdDescriptor>;

/**
 * @brief Console ports of running emulators from `adb devices`
 *
 * Only `emulator-<port>` serials are reported, whatever their state;
 * physical devices are ignored.
 */
[[nodiscard]] auto parseAdbDevices(std::string_view text) -> std::vector<int>;

/**
 * @brief One trimmed identifier per non-blank line
 *
 * Used for `emulator -list-avds` and `avdmanager list device -c`. Emulator
 * diagnostic lines ("INFO    | ...") are skipped.
 */
[[nodiscard]] auto parseNameList(std::string_view text)
    -> std::vector<std::string>;

}  // namespace devpreview::parser
