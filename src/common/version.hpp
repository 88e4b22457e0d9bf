#ifndef DEVPREVIEW_COMMON_VERSION_HPP
#define DEVPREVIEW_COMMON_VERSION_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace devpreview {

/**
 * @brief A numeric x[.y[.z]] or x[-y[-z]] version.
 *
 * Runtime and API level strings that do not follow this syntax (for example
 * Android codenames such as "Tiramisu") are not representable as a Version;
 * they stay raw strings and are ordered by Version::compare.
 */
class Version {
public:
    /**
     * @brief Default constructor initializing version to 0.0.0.
     */
    constexpr Version() noexcept = default;

    /**
     * @brief Constructs a Version object with specified values.
     * @param maj Major version number
     * @param min Minor version number
     * @param pat Patch version number
     * @param separator Separator used when rendering ('.' or '-')
     */
    constexpr Version(int maj, int min, int pat, char separator = '.') noexcept
        : major_(maj), minor_(min), patch_(pat), separator_(separator) {}

    /**
     * @brief Parses a version string.
     *
     * Accepts "x", "x.y", "x.y.z", "x-y", "x-y-z" (surrounding whitespace is
     * ignored). The separator must be the same throughout and components
     * other than a bare "0" must not have leading zeros. A component that
     * does not fit in an int is rejected, so such a string is a codename.
     *
     * @param input The version string to parse
     * @return Parsed Version, or std::nullopt for anything else
     */
    [[nodiscard]] static auto parse(std::string_view input)
        -> std::optional<Version>;

    using VersionLike = std::variant<Version, std::string>;

    /**
     * @brief Orders two versions, either of which may be a raw string.
     *
     * A raw string that does not parse is a codename. Codenames are always
     * newer than numeric versions, and two codenames compare equal only when
     * they match ignoring ASCII case. Accented letters are compared byte for
     * byte, so "Tiramisú" and "Tiramisu" are distinct codenames.
     *
     * @return -1 if lhs is older, 0 if the same, 1 if newer
     * @throws UnsupportedComparisonError if both sides are distinct codenames
     */
    [[nodiscard]] static auto compare(const VersionLike& lhs,
                                      const VersionLike& rhs) -> int;

    [[nodiscard]] static auto same(const VersionLike& lhs,
                                   const VersionLike& rhs) -> bool;

    [[nodiscard]] static auto sameOrNewer(const VersionLike& lhs,
                                          const VersionLike& rhs) -> bool;

    /**
     * @brief Renders the version as major, minor and patch joined by the
     * separator it was parsed with.
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] constexpr auto major() const noexcept -> int {
        return major_;
    }
    [[nodiscard]] constexpr auto minor() const noexcept -> int {
        return minor_;
    }
    [[nodiscard]] constexpr auto patch() const noexcept -> int {
        return patch_;
    }
    [[nodiscard]] constexpr auto separator() const noexcept -> char {
        return separator_;
    }

    constexpr auto operator==(const Version& other) const noexcept -> bool {
        return major_ == other.major_ && minor_ == other.minor_ &&
               patch_ == other.patch_;
    }

    constexpr auto operator<(const Version& other) const noexcept -> bool {
        if (major_ != other.major_)
            return major_ < other.major_;
        if (minor_ != other.minor_)
            return minor_ < other.minor_;
        return patch_ < other.patch_;
    }

private:
    int major_{0};
    int minor_{0};
    int patch_{0};
    char separator_{'.'};
};

auto operator<<(std::ostream& os, const Version& version) -> std::ostream&;

}  // namespace devpreview

#endif  // DEVPREVIEW_COMMON_VERSION_HPP
