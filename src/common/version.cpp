#include "version.hpp"

#include <charconv>
#include <vector>

#include "preview_exceptions.hpp"
#include "string_utils.hpp"

namespace devpreview {

namespace {

auto parseComponent(std::string_view part) -> std::optional<int> {
    if (part.empty()) {
        return std::nullopt;
    }
    for (char c : part) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    if (part.size() > 1 && part.front() == '0') {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc{} || ptr != part.data() + part.size()) {
        return std::nullopt;
    }
    return value;
}

auto codenameOf(const Version::VersionLike& v) -> std::string {
    if (const auto* raw = std::get_if<std::string>(&v)) {
        return *raw;
    }
    return std::get<Version>(v).toString();
}

auto resolve(const Version::VersionLike& v) -> std::optional<Version> {
    if (const auto* version = std::get_if<Version>(&v)) {
        return *version;
    }
    return Version::parse(std::get<std::string>(v));
}

}  // namespace

auto Version::parse(std::string_view input) -> std::optional<Version> {
    auto trimmed = utils::trim(input);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    char separator = '.';
    auto sepPos = trimmed.find_first_of(".-");
    if (sepPos != std::string_view::npos) {
        separator = trimmed[sepPos];
    }

    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto next = trimmed.find(separator, start);
        parts.push_back(trimmed.substr(start, next == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : next - start));
        if (next == std::string_view::npos) {
            break;
        }
        start = next + 1;
    }

    if (parts.size() > 3) {
        return std::nullopt;
    }

    int values[3] = {0, 0, 0};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto component = parseComponent(parts[i]);
        if (!component) {
            return std::nullopt;
        }
        values[i] = *component;
    }

    return Version(values[0], values[1], values[2], separator);
}

auto Version::compare(const VersionLike& lhs, const VersionLike& rhs) -> int {
    auto v1 = resolve(lhs);
    auto v2 = resolve(rhs);

    if (!v1 && !v2) {
        auto name1 = codenameOf(lhs);
        auto name2 = codenameOf(rhs);
        if (utils::iequals(utils::trim(name1), utils::trim(name2))) {
            return 0;
        }
        throw UnsupportedComparisonError(name1, name2);
    }
    // Codenames are the bleeding-edge release and rank above any number.
    if (!v1) {
        return 1;
    }
    if (!v2) {
        return -1;
    }

    if (*v1 == *v2) {
        return 0;
    }
    return *v1 < *v2 ? -1 : 1;
}

auto Version::same(const VersionLike& lhs, const VersionLike& rhs) -> bool {
    return compare(lhs, rhs) == 0;
}

auto Version::sameOrNewer(const VersionLike& lhs, const VersionLike& rhs)
    -> bool {
    return compare(lhs, rhs) >= 0;
}

auto Version::toString() const -> std::string {
    return std::to_string(major_) + separator_ + std::to_string(minor_) +
           separator_ + std::to_string(patch_);
}

auto operator<<(std::ostream& outputStream, const Version& version)
    -> std::ostream& {
    outputStream << version.toString();
    return outputStream;
}

}  // namespace devpreview
