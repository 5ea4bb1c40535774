/**
 * @file semver.cpp
 * @brief Semantic version parsing, ordering and bump arithmetic
 */

#include "semverpp/semver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace semverpp::semver {

namespace {

[[nodiscard]] semverpp::Error invalid_version(std::string_view text, std::string_view reason)
{
    return Error::make(std::string(error_code::kInvalidVersion),
                       std::format("Invalid version '{}': {}", text, reason));
}

[[nodiscard]] bool is_separator(char c) noexcept
{
    return c == '-' || c == '.' || c == '_';
}

[[nodiscard]] bool is_digit(char c) noexcept
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_alpha(char c) noexcept
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

/// Read a run of digits starting at pos; advances pos past them.
[[nodiscard]] std::optional<std::uint64_t> read_number(std::string_view text, std::size_t& pos)
{
    const std::size_t start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const char* begin = text.data() + start;
    const char* end = text.data() + pos;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string_view to_string(ReleaseType type) noexcept
{
    switch (type) {
        case ReleaseType::kMajor:
            return "major";
        case ReleaseType::kMinor:
            return "minor";
        case ReleaseType::kPatch:
            return "patch";
    }
    return "patch";
}

std::string_view to_string(Channel channel) noexcept
{
    switch (channel) {
        case Channel::kAlpha:
            return "alpha";
        case Channel::kBeta:
            return "beta";
        case Channel::kRc:
            return "rc";
    }
    return "alpha";
}

semverpp::Result<ReleaseType> parse_release_type(std::string_view text)
{
    if (text == "major") {
        return ReleaseType::kMajor;
    }
    if (text == "minor") {
        return ReleaseType::kMinor;
    }
    if (text == "patch") {
        return ReleaseType::kPatch;
    }
    return std::unexpected(
        Error::make(std::string(error_code::kInvalidChangeType),
                    std::format("Invalid change type '{}' (expected major, minor or patch)", text)));
}

semverpp::Result<Channel> parse_channel(std::string_view text)
{
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "alpha" || lowered == "a") {
        return Channel::kAlpha;
    }
    if (lowered == "beta" || lowered == "b") {
        return Channel::kBeta;
    }
    if (lowered == "rc") {
        return Channel::kRc;
    }
    return std::unexpected(
        Error::make(std::string(error_code::kInvalidPrerelease),
                    std::format("Invalid prerelease channel '{}' (expected alpha, beta or rc)",
                                text)));
}

SemVersion::SemVersion(std::uint64_t major,
                       std::uint64_t minor,
                       std::uint64_t patch,
                       std::optional<Prerelease> pre)
    : m_major(major)
    , m_minor(minor)
    , m_patch(patch)
    , m_pre(pre)
{}

semverpp::Result<SemVersion> SemVersion::parse(std::string_view text)
{
    std::size_t pos = 0;
    if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) {
        pos = 1;
    }

    std::array<std::uint64_t, 3> parts{};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            if (pos >= text.size() || text[pos] != '.') {
                return std::unexpected(invalid_version(text, "expected MAJOR.MINOR.PATCH"));
            }
            ++pos;
        }
        auto number = read_number(text, pos);
        if (!number) {
            return std::unexpected(invalid_version(text, "expected MAJOR.MINOR.PATCH"));
        }
        parts[i] = *number;
    }

    if (pos == text.size()) {
        return SemVersion(parts[0], parts[1], parts[2]);
    }

    if (is_separator(text[pos])) {
        ++pos;
    }
    const std::size_t label_start = pos;
    while (pos < text.size() && is_alpha(text[pos])) {
        ++pos;
    }
    if (pos == label_start) {
        return std::unexpected(invalid_version(text, "expected a prerelease label"));
    }
    auto channel = parse_channel(text.substr(label_start, pos - label_start));
    if (!channel) {
        return std::unexpected(invalid_version(text, channel.error().message));
    }

    std::uint64_t counter = 0;
    if (pos < text.size()) {
        if (is_separator(text[pos])) {
            ++pos;
        }
        auto number = read_number(text, pos);
        if (!number) {
            return std::unexpected(invalid_version(text, "expected a prerelease number"));
        }
        counter = *number;
    }
    if (pos != text.size()) {
        return std::unexpected(invalid_version(text, "unexpected trailing characters"));
    }

    return SemVersion(parts[0],
                      parts[1],
                      parts[2],
                      Prerelease{.channel = *channel, .counter = counter});
}

SemVersion SemVersion::stable() const
{
    return SemVersion(m_major, m_minor, m_patch);
}

std::string SemVersion::to_string() const
{
    if (!m_pre) {
        return std::format("{}.{}.{}", m_major, m_minor, m_patch);
    }
    return std::format("{}.{}.{}-{}.{}",
                       m_major,
                       m_minor,
                       m_patch,
                       semver::to_string(m_pre->channel),
                       m_pre->counter);
}

SemVersion SemVersion::next_version(ReleaseType type, std::optional<Channel> channel) const
{
    if (channel) {
        return bump_prerelease(type, *channel);
    }
    return bump_stable(type);
}

SemVersion SemVersion::bump_triple(ReleaseType type) const
{
    switch (type) {
        case ReleaseType::kMajor:
            return SemVersion(m_major + 1, 0, 0);
        case ReleaseType::kMinor:
            return SemVersion(m_major, m_minor + 1, 0);
        case ReleaseType::kPatch:
            return SemVersion(m_major, m_minor, m_patch + 1);
    }
    return SemVersion(m_major, m_minor, m_patch + 1);
}

SemVersion SemVersion::bump_stable(ReleaseType type) const
{
    if (is_stable()) {
        return bump_triple(type);
    }
    switch (type) {
        case ReleaseType::kMajor:
            if (m_minor == 0 && m_patch == 0) {
                return stable();
            }
            break;
        case ReleaseType::kMinor:
            if (m_patch == 0) {
                return stable();
            }
            break;
        case ReleaseType::kPatch:
            return stable();
    }
    return bump_triple(type);
}

SemVersion SemVersion::bump_prerelease(ReleaseType type, Channel channel) const
{
    const SemVersion target = bump_stable(type);

    SemVersion candidate;
    if (is_stable() || m_pre->channel != channel) {
        // bump_stable never goes below the current triple, so the target
        // triple is either the same base or the advanced one.
        candidate = SemVersion(target.m_major,
                               target.m_minor,
                               target.m_patch,
                               Prerelease{.channel = channel, .counter = 1});
    } else {
        candidate = SemVersion(m_major,
                               m_minor,
                               m_patch,
                               Prerelease{.channel = channel,
                                          .counter = std::max<std::uint64_t>(1, m_pre->counter) + 1});
    }

    if (candidate <= *this) {
        const SemVersion fresh = bump_triple(type);
        return SemVersion(fresh.m_major,
                          fresh.m_minor,
                          fresh.m_patch,
                          Prerelease{.channel = channel, .counter = 1});
    }
    return candidate;
}

std::strong_ordering SemVersion::operator<=>(const SemVersion& other) const noexcept
{
    if (auto cmp = m_major <=> other.m_major; cmp != 0) {
        return cmp;
    }
    if (auto cmp = m_minor <=> other.m_minor; cmp != 0) {
        return cmp;
    }
    if (auto cmp = m_patch <=> other.m_patch; cmp != 0) {
        return cmp;
    }
    if (!m_pre || !other.m_pre) {
        // Stable sorts above any prerelease of the same triple.
        return other.m_pre.has_value() <=> m_pre.has_value();
    }
    if (auto cmp = m_pre->channel <=> other.m_pre->channel; cmp != 0) {
        return cmp;
    }
    return m_pre->counter <=> other.m_pre->counter;
}

bool SemVersion::operator==(const SemVersion& other) const noexcept
{
    return (*this <=> other) == 0;
}

}  // namespace semverpp::semver
