/*
 * android_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Parsers for Android SDK command line tool output

*************************************************/

#include "android_parser.hpp"

#include <algorithm>
#include <charconv>
#include <unordered_set>

#include "common/string_utils.hpp"

namespace devpreview::parser {

namespace {

constexpr std::string_view kInstalledHeader = "installed packages:";
constexpr std::string_view kAvailableFooter = "available packages:";
constexpr std::string_view kUpdatesFooter = "available updates:";
constexpr std::string_view kEmulatorSerialPrefix = "emulator-";

auto contains(std::string_view haystack, std::string_view needle) -> bool {
    return haystack.find(needle) != std::string_view::npos;
}

auto isDashLine(std::string_view line) -> bool {
    return !line.empty() &&
           std::all_of(line.begin(), line.end(), [](char c) { return c == '-'; });
}

auto pathSegments(const std::string& path) -> std::vector<std::string_view> {
    return utils::split(path, ';');
}

auto stripAndroidPrefix(std::string_view segment) -> std::string {
    constexpr std::string_view kPrefix = "android-";
    if (segment.starts_with(kPrefix)) {
        segment.remove_prefix(kPrefix.size());
    }
    return std::string(segment);
}

}  // namespace

auto packageKindToString(PackageKind kind) -> std::string {
    switch (kind) {
        case PackageKind::Platform:
            return "Platform";
        case PackageKind::SystemImage:
            return "SystemImage";
        case PackageKind::BuildTools:
            return "BuildTools";
        case PackageKind::Other:
        default:
            return "Other";
    }
}

auto PackageCatalogEntry::kind() const -> PackageKind {
    auto segments = pathSegments(path);
    if (segments.front() == "platforms") {
        return PackageKind::Platform;
    }
    if (segments.front() == "system-images") {
        return PackageKind::SystemImage;
    }
    if (segments.front() == "build-tools") {
        return PackageKind::BuildTools;
    }
    return PackageKind::Other;
}

auto PackageCatalogEntry::apiLevel() const -> std::string {
    auto segments = pathSegments(path);
    auto k = kind();
    if ((k == PackageKind::Platform || k == PackageKind::SystemImage) &&
        segments.size() > 1) {
        return stripAndroidPrefix(segments[1]);
    }
    return {};
}

auto PackageCatalogEntry::tag() const -> std::string {
    auto segments = pathSegments(path);
    if (kind() == PackageKind::SystemImage && segments.size() > 2) {
        return std::string(segments[2]);
    }
    return {};
}

auto PackageCatalogEntry::abi() const -> std::string {
    auto segments = pathSegments(path);
    if (kind() == PackageKind::SystemImage && segments.size() > 3) {
        return std::string(segments[3]);
    }
    return {};
}

auto PackageCatalogEntry::toJson() const -> nlohmann::json {
    return {{"path", path},
            {"version", version},
            {"description", description},
            {"location", installLocation}};
}

PackageCatalog::PackageCatalog(std::vector<PackageCatalogEntry> entries)
    : entries_(std::move(entries)) {}

auto PackageCatalog::find(std::string_view path) const
    -> std::optional<PackageCatalogEntry> {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [path](const auto& e) { return e.path == path; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

auto PackageCatalog::platforms() const -> std::vector<PackageCatalogEntry> {
    std::vector<PackageCatalogEntry> result;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                 [](const auto& e) { return e.kind() == PackageKind::Platform; });
    return result;
}

auto PackageCatalog::systemImages() const -> std::vector<PackageCatalogEntry> {
    std::vector<PackageCatalogEntry> result;
    std::copy_if(
        entries_.begin(), entries_.end(), std::back_inserter(result),
        [](const auto& e) { return e.kind() == PackageKind::SystemImage; });
    return result;
}

auto parsePackageCatalog(std::string_view text, bool requireHeader)
    -> PreviewResult<PackageCatalog> {
    auto lines = utils::splitLines(text);
    auto header = std::find_if(lines.begin(), lines.end(), [](auto line) {
        return contains(utils::toLower(line), kInstalledHeader);
    });
    if (header == lines.end()) {
        if (requireHeader) {
            return failure(PreviewErrorCode::FormatError,
                           "sdkmanager output has no installed packages table");
        }
        return PackageCatalog{};
    }

    std::vector<PackageCatalogEntry> entries;
    std::unordered_set<std::string> seen;
    for (auto it = std::next(header); it != lines.end(); ++it) {
        auto lowered = utils::toLower(*it);
        if (contains(lowered, kAvailableFooter) ||
            contains(lowered, kUpdatesFooter)) {
            break;
        }
        auto line = utils::trim(*it);
        if (line.empty() || !contains(line, "|")) {
            continue;
        }

        auto columns = utils::split(line, '|');
        auto path = std::string(utils::trim(columns[0]));
        if (path.empty() || utils::iequals(path, "Path") || isDashLine(path)) {
            continue;
        }
        if (!seen.insert(path).second) {
            continue;
        }

        PackageCatalogEntry entry;
        entry.path = std::move(path);
        if (columns.size() > 1) {
            entry.version = std::string(utils::trim(columns[1]));
        }
        if (columns.size() > 2) {
            entry.description = std::string(utils::trim(columns[2]));
        }
        if (columns.size() > 3) {
            entry.installLocation = std::string(utils::trim(columns[3]));
        }
        entries.push_back(std::move(entry));
    }

    return PackageCatalog(std::move(entries));
}

auto AvdDescriptor::toJson() const -> nlohmann::json {
    return {{"name", name},     {"device", device}, {"path", path},
            {"target", target}, {"basedOn", basedOn}, {"tagAbi", tagAbi},
            {"skin", skin},     {"sdcard", sdcard}};
}

auto parseAvdList(std::string_view text) -> std::vector<AvdDescriptor> {
    std::vector<AvdDescriptor> avds;
    AvdDescriptor current;

    auto flush = [&avds, &current]() {
        if (!current.name.empty()) {
            avds.push_back(std::move(current));
        }
        current = AvdDescriptor{};
    };

    for (auto raw : utils::splitLines(text)) {
        auto line = utils::trim(raw);
        if (contains(line, "could not be loaded")) {
            break;
        }
        if (isDashLine(line)) {
            flush();
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        auto key = utils::trim(line.substr(0, colon));
        auto value = utils::trim(line.substr(colon + 1));

        if (key == "Name") {
            current.name = value;
        } else if (key == "Device") {
            current.device = value;
        } else if (key == "Path") {
            current.path = value;
        } else if (key == "Target") {
            current.target = value;
        } else if (key == "Skin") {
            current.skin = value;
        } else if (key == "Sdcard") {
            current.sdcard = value;
        } else if (key == "Based on") {
            constexpr std::string_view kTagAbi = "Tag/ABI:";
            auto tagPos = value.find(kTagAbi);
            if (tagPos == std::string_view::npos) {
                current.basedOn = value;
            } else {
                current.basedOn = utils::trim(value.substr(0, tagPos));
                current.tagAbi =
                    utils::trim(value.substr(tagPos + kTagAbi.size()));
            }
        }
    }
    flush();

    return avds;
}

auto parseAdbDevices(std::string_view text) -> std::vector<int> {
    std::vector<int> ports;
    for (auto raw : utils::splitLines(text)) {
        auto line = utils::trim(raw);
        if (!line.starts_with(kEmulatorSerialPrefix)) {
            continue;
        }
        auto serial = line.substr(kEmulatorSerialPrefix.size());
        auto end = serial.find_first_of(" \t");
        auto digits = serial.substr(0, end);

        int port = 0;
        auto [ptr, ec] =
            std::from_chars(digits.data(), digits.data() + digits.size(), port);
        if (ec == std::errc() && ptr == digits.data() + digits.size()) {
            ports.push_back(port);
        }
    }
    return ports;
}

auto parseNameList(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (auto raw : utils::splitLines(text)) {
        auto line = utils::trim(raw);
        if (line.empty() || contains(line, "|")) {
            continue;
        }
        names.emplace_back(line);
    }
    return names;
}

}  // namespace devpreview::parser
