#pragma once

/**
 * @file release.hpp
 * @brief Release coordination: the operations a project runs against its changes
 */

#include "semverpp/common.hpp"
#include "semverpp/model.hpp"
#include "semverpp/schema_validate.hpp"
#include "semverpp/semver.hpp"
#include "semverpp/store.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace semverpp::release {

struct ProjectConfig
{
    std::filesystem::path base_path = ".";  ///< Directory holding .semversioner/
    /// JSON Schemas for stored records
    std::filesystem::path schema_dir = common::default_schema_dir();
};

struct ReleaseResult
{
    std::string previous_version;
    model::Release release;
    std::filesystem::path path;  ///< Written release record
};

/**
 * @brief Orchestrates the changeset store, release store and version engine
 *
 * Every call re-reads the filesystem. Only add_change() is safe to run
 * concurrently; release() expects external serialization.
 */
class ReleaseCoordinator
{
public:
    explicit ReleaseCoordinator(ProjectConfig config);

    /**
     * @brief Record a pending change
     * @return Path of the created changeset file
     */
    [[nodiscard]] semverpp::Result<std::filesystem::path>
    add_change(semver::ReleaseType type,
               std::string description,
               model::Attributes attributes = {},
               std::optional<semver::Channel> pre = std::nullopt);

    /**
     * @brief Cut a release from every pending change
     *
     * Writes {version}.json, then removes the pending area.
     * @return NoChangesPending when nothing is pending
     */
    [[nodiscard]] semverpp::Result<ReleaseResult> release();

    /**
     * @brief Render the changelog
     * @param version Restrict to one version
     * @param template_source Custom template text; the default template otherwise
     */
    [[nodiscard]] semverpp::Result<std::string>
    generate_changelog(const std::optional<std::string>& version = std::nullopt,
                       const std::optional<std::string>& template_source = std::nullopt) const;

    /// Highest released version, "0.0.0" when nothing is released.
    [[nodiscard]] semverpp::Result<std::string> get_last_version() const;

    /// Version the pending changes would produce; nullopt when nothing is pending.
    [[nodiscard]] semverpp::Result<std::optional<std::string>> get_next_version() const;

    [[nodiscard]] semverpp::Result<model::ReleaseStatus> get_status() const;

    /// True iff at least one changeset is pending.
    [[nodiscard]] semverpp::Result<bool> check() const;

    /// True when the repository still uses the legacy ".changes" directory.
    [[nodiscard]] bool is_deprecated() const noexcept { return m_layout.legacy; }

    [[nodiscard]] const store::Layout& layout() const noexcept { return m_layout; }

private:
    ProjectConfig m_config;
    store::Layout m_layout;
    store::ChangesetStore m_changes;
    store::ReleaseStore m_releases;

    [[nodiscard]] semverpp::Result<semver::SemVersion> current_version() const;
};

}  // namespace semverpp::release
