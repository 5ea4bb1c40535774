/**
 * @file engine.cpp
 * @brief Next-version computation over a batch of pending changesets
 */

#include "semverpp/engine.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace semverpp::engine {

semverpp::Result<std::optional<BumpRequest>> select_bump(std::span<const model::Changeset> changes)
{
    if (changes.empty()) {
        return std::optional<BumpRequest>{};
    }

    const auto prerelease_count =
        std::ranges::count_if(changes, [](const model::Changeset& c) { return c.pre.has_value(); });
    if (prerelease_count != 0 && std::cmp_not_equal(prerelease_count, changes.size())) {
        return std::unexpected(Error::make(
            std::string(error_code::kMixedChanges),
            std::format("Pending changes mix stable and prerelease changesets ({} of {} are "
                        "prerelease); release them separately",
                        prerelease_count,
                        changes.size())));
    }

    BumpRequest request{.type = changes.front().type, .channel = std::nullopt};
    for (const auto& change : changes) {
        request.type = std::max(request.type, change.type);
        if (change.pre) {
            request.channel = request.channel ? std::max(*request.channel, *change.pre) : *change.pre;
        }
    }
    return std::optional<BumpRequest>{request};
}

semverpp::Result<std::optional<semver::SemVersion>>
next_version(const semver::SemVersion& current, std::span<const model::Changeset> changes)
{
    auto request = select_bump(changes);
    if (!request) {
        return std::unexpected(request.error());
    }
    if (!*request) {
        return std::optional<semver::SemVersion>{};
    }
    return std::optional<semver::SemVersion>{
        current.next_version((*request)->type, (*request)->channel)};
}

}  // namespace semverpp::engine
