#pragma once

/**
 * @file model.hpp
 * @brief Changeset / Release records and their JSON mapping
 */

#include "semverpp/common.hpp"
#include "semverpp/semver.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace semverpp::model {

using Attributes = std::map<std::string, std::string>;

/**
 * @brief A single pending change, not yet assigned to a version
 */
struct Changeset
{
    semver::ReleaseType type = semver::ReleaseType::kPatch;
    std::string description;
    Attributes attributes;               ///< Optional, free-form key/value pairs
    std::optional<semver::Channel> pre;  ///< Prerelease channel; nullopt for stable changes

    [[nodiscard]] friend bool operator==(const Changeset&, const Changeset&) = default;
};

/**
 * @brief An immutable, version-tagged aggregation of changesets
 */
struct Release
{
    std::string version;
    std::vector<Changeset> changes;
    std::optional<common::SysSeconds> created_at;  ///< Absent in legacy records

    [[nodiscard]] friend bool operator==(const Release&, const Release&) = default;
};

/**
 * @brief Snapshot of the repository state, derived on demand
 */
struct ReleaseStatus
{
    std::string version;
    std::optional<std::string> next_version;
    std::vector<Changeset> pending_changes;

    [[nodiscard]] friend bool operator==(const ReleaseStatus&, const ReleaseStatus&) = default;
};

/**
 * On-disk shape of a release record
 * - kCurrent: {"version", "created_at", "changes"}
 * - kLegacy: bare array of changes, version taken from the filename
 */
enum class ReleaseFormat { kCurrent, kLegacy };

/**
 * Deterministic changeset order: (type, description) ascending
 */
[[nodiscard]] bool changeset_less(const Changeset& a, const Changeset& b);

/**
 * Sort changesets in place using changeset_less
 */
void sort_changesets(std::vector<Changeset>& changes);

[[nodiscard]] nlohmann::json to_json(const Changeset& change);
[[nodiscard]] nlohmann::json to_json(const Release& release);

/**
 * Parse a changeset object. Unrecognized fields are ignored.
 * @param j JSON object
 * @param source Where the document came from (used in error messages)
 */
[[nodiscard]] semverpp::Result<Changeset> changeset_from_json(const nlohmann::json& j,
                                                              std::string_view source);

/**
 * Detect which record shape a release document uses
 * @return Format, or ParseError if it is neither
 */
[[nodiscard]] semverpp::Result<ReleaseFormat> detect_release_format(const nlohmann::json& j);

/**
 * Parse a release document in either format into one Release shape.
 * The version is rendered canonically and the changes are sorted.
 *
 * @param j Parsed file content
 * @param release_identifier Filename without ".json" (the version of legacy records)
 */
[[nodiscard]] semverpp::Result<Release> release_from_json(const nlohmann::json& j,
                                                          std::string_view release_identifier);

}  // namespace semverpp::model
