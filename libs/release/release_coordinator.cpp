/**
 * @file release_coordinator.cpp
 * @brief Release coordination over the changeset and release stores
 */

#include "semverpp/release.hpp"

#include "semverpp/changelog.hpp"
#include "semverpp/engine.hpp"
#include "semverpp/version.hpp"

#include <chrono>
#include <format>
#include <string>
#include <utility>

namespace semverpp::release {

ReleaseCoordinator::ReleaseCoordinator(ProjectConfig config)
    : m_config(std::move(config))
    , m_layout(store::detect_layout(m_config.base_path))
    , m_changes(m_layout, m_config.schema_dir)
    , m_releases(m_layout, m_config.schema_dir)
{}

semverpp::Result<std::filesystem::path>
ReleaseCoordinator::add_change(semver::ReleaseType type,
                               std::string description,
                               model::Attributes attributes,
                               std::optional<semver::Channel> pre)
{
    const model::Changeset change{.type = type,
                                  .description = std::move(description),
                                  .attributes = std::move(attributes),
                                  .pre = pre};
    return m_changes.create(change);
}

semverpp::Result<semver::SemVersion> ReleaseCoordinator::current_version() const
{
    auto last = m_releases.last_version();
    if (!last) {
        return std::unexpected(last.error());
    }
    if (*last) {
        return **last;
    }
    return semver::SemVersion::parse(kInitialVersion);
}

semverpp::Result<ReleaseResult> ReleaseCoordinator::release()
{
    auto current = current_version();
    if (!current) {
        return std::unexpected(current.error());
    }
    auto changes = m_changes.list();
    if (!changes) {
        return std::unexpected(changes.error());
    }

    auto next = engine::next_version(*current, *changes);
    if (!next) {
        return std::unexpected(next.error());
    }
    if (!*next) {
        return std::unexpected(Error::make(std::string(error_code::kNoChangesPending),
                                           "No changes to release. Skipping release process."));
    }

    ReleaseResult result{
        .previous_version = current->to_string(),
        .release = model::Release{.version = (*next)->to_string(),
                                  .changes = std::move(*changes),
                                  .created_at = std::chrono::floor<std::chrono::seconds>(
                                      std::chrono::system_clock::now())},
        .path = {},
    };

    auto path = m_releases.create(result.release);
    if (!path) {
        return std::unexpected(path.error());
    }
    result.path = std::move(*path);

    if (auto cleared = m_changes.clear(); !cleared) {
        return std::unexpected(cleared.error());
    }
    return result;
}

semverpp::Result<std::string>
ReleaseCoordinator::generate_changelog(const std::optional<std::string>& version,
                                       const std::optional<std::string>& template_source) const
{
    auto releases = m_releases.list();
    if (!releases) {
        return std::unexpected(releases.error());
    }
    if (template_source) {
        return changelog::generate(*releases, version, *template_source);
    }
    return changelog::generate(*releases, version);
}

semverpp::Result<std::string> ReleaseCoordinator::get_last_version() const
{
    auto current = current_version();
    if (!current) {
        return std::unexpected(current.error());
    }
    return current->to_string();
}

semverpp::Result<std::optional<std::string>> ReleaseCoordinator::get_next_version() const
{
    auto current = current_version();
    if (!current) {
        return std::unexpected(current.error());
    }
    auto changes = m_changes.list();
    if (!changes) {
        return std::unexpected(changes.error());
    }
    auto next = engine::next_version(*current, *changes);
    if (!next) {
        return std::unexpected(next.error());
    }
    if (!*next) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{(*next)->to_string()};
}

semverpp::Result<model::ReleaseStatus> ReleaseCoordinator::get_status() const
{
    auto current = current_version();
    if (!current) {
        return std::unexpected(current.error());
    }
    auto changes = m_changes.list();
    if (!changes) {
        return std::unexpected(changes.error());
    }
    auto next = engine::next_version(*current, *changes);
    if (!next) {
        return std::unexpected(next.error());
    }

    model::ReleaseStatus status{.version = current->to_string(),
                                .next_version = std::nullopt,
                                .pending_changes = std::move(*changes)};
    if (*next) {
        status.next_version = (*next)->to_string();
    }
    return status;
}

semverpp::Result<bool> ReleaseCoordinator::check() const
{
    auto changes = m_changes.list();
    if (!changes) {
        return std::unexpected(changes.error());
    }
    return !changes->empty();
}

}  // namespace semverpp::release
