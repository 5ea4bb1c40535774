#pragma once

/**
 * @file engine.hpp
 * @brief Next-version computation over a batch of pending changesets
 */

#include "semverpp/common.hpp"
#include "semverpp/model.hpp"
#include "semverpp/semver.hpp"

#include <optional>
#include <span>

namespace semverpp::engine {

/**
 * @brief What a pending batch asks for
 */
struct BumpRequest
{
    semver::ReleaseType type;               ///< Most severe type present
    std::optional<semver::Channel> channel; ///< Highest-ranked channel, if prerelease

    [[nodiscard]] friend bool operator==(const BumpRequest&, const BumpRequest&) = default;
};

/**
 * @brief Reduce a batch of changesets to a single bump request
 *
 * @return nullopt for an empty batch; MixedChanges error when the batch holds
 *         both stable and prerelease changesets
 */
[[nodiscard]] semverpp::Result<std::optional<BumpRequest>>
select_bump(std::span<const model::Changeset> changes);

/**
 * @brief Compute the next version
 *
 * @param current Current (highest released) version
 * @param changes Pending changesets
 * @return nullopt when nothing is pending, otherwise a version strictly
 *         greater than current
 */
[[nodiscard]] semverpp::Result<std::optional<semver::SemVersion>>
next_version(const semver::SemVersion& current, std::span<const model::Changeset> changes);

}  // namespace semverpp::engine
