#pragma once

/**
 * @file semver.hpp
 * @brief Semantic version value type with prerelease channels
 *
 * Rendering: "1.2.3" for stable versions, "1.2.3-alpha.1" for prereleases.
 * Parsing also accepts the compact forms written by older tools
 * ("1.2.3alpha1", "1.2.3a1", "1.2.3.rc1", "1.2.3-rc1", "v1.2.3").
 */

#include "semverpp/common.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace semverpp::semver {

/**
 * Release type (severity of a change)
 *
 * Declared in ascending severity so that comparisons order by severity.
 */
enum class ReleaseType : std::uint8_t {
    kPatch,
    kMinor,
    kMajor,
};

/**
 * Prerelease channel, declared in ascending rank: alpha < beta < rc.
 *
 * The same rank decides which channel wins when several are pending and
 * whether one prerelease is newer than another.
 */
enum class Channel : std::uint8_t {
    kAlpha,
    kBeta,
    kRc,
};

[[nodiscard]] std::string_view to_string(ReleaseType type) noexcept;
[[nodiscard]] std::string_view to_string(Channel channel) noexcept;

/// Parse "major" | "minor" | "patch"
[[nodiscard]] semverpp::Result<ReleaseType> parse_release_type(std::string_view text);

/// Parse "alpha" | "beta" | "rc" (and the aliases "a" / "b")
[[nodiscard]] semverpp::Result<Channel> parse_channel(std::string_view text);

struct Prerelease
{
    Channel channel = Channel::kAlpha;
    std::uint64_t counter = 0;

    [[nodiscard]] friend bool operator==(const Prerelease&, const Prerelease&) = default;
};

class SemVersion
{
public:
    SemVersion() = default;
    SemVersion(std::uint64_t major,
               std::uint64_t minor,
               std::uint64_t patch,
               std::optional<Prerelease> pre = std::nullopt);

    /**
     * @brief Parse a version string
     * @return Version or InvalidVersion error
     */
    [[nodiscard]] static semverpp::Result<SemVersion> parse(std::string_view text);

    [[nodiscard]] std::uint64_t major() const noexcept { return m_major; }
    [[nodiscard]] std::uint64_t minor() const noexcept { return m_minor; }
    [[nodiscard]] std::uint64_t patch() const noexcept { return m_patch; }
    [[nodiscard]] const std::optional<Prerelease>& pre() const noexcept { return m_pre; }

    [[nodiscard]] bool is_stable() const noexcept { return !m_pre.has_value(); }
    [[nodiscard]] bool is_prerelease() const noexcept { return m_pre.has_value(); }

    /// Stable version of the same triple ("2.1.0-alpha.2" -> "2.1.0")
    [[nodiscard]] SemVersion stable() const;

    /// Canonical rendering
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Compute the next version
     *
     * @param type Most severe pending release type
     * @param channel Prerelease channel, or nullopt for a stable bump
     * @return A version strictly greater than this one
     */
    [[nodiscard]] SemVersion next_version(ReleaseType type,
                                          std::optional<Channel> channel = std::nullopt) const;

    /**
     * @brief Stable bump
     *
     * A prerelease is promoted to its stable triple unless the requested type
     * is more severe than the one the prerelease was heading toward
     * (x.0.0 -> major, x.y.0 -> minor, x.y.z -> patch); then the plain
     * arithmetic applies to the triple ("2.1.1-alpha.1" + minor -> "2.2.0").
     */
    [[nodiscard]] SemVersion bump_stable(ReleaseType type) const;

    /**
     * @brief Prerelease bump on a channel
     *
     * Same channel increments the counter; a new channel restarts at 1 on the
     * stable-bump target triple. Never returns a version <= this one.
     */
    [[nodiscard]] SemVersion bump_prerelease(ReleaseType type, Channel channel) const;

    [[nodiscard]] std::strong_ordering operator<=>(const SemVersion& other) const noexcept;
    [[nodiscard]] bool operator==(const SemVersion& other) const noexcept;

private:
    std::uint64_t m_major = 0;
    std::uint64_t m_minor = 0;
    std::uint64_t m_patch = 0;
    std::optional<Prerelease> m_pre;

    /// Plain arithmetic on the triple, ignoring any prerelease tag
    [[nodiscard]] SemVersion bump_triple(ReleaseType type) const;
};

}  // namespace semverpp::semver
