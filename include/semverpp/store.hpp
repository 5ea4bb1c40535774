#pragma once

/**
 * @file store.hpp
 * @brief Filesystem stores: pending changesets and released versions
 *
 * Layout (under the caller's base path):
 *   .semversioner/                   (or legacy .changes/)
 *     next-release/
 *       {type}-{yyyyMMddHHmmssffffff}.json
 *     {version}.json
 *
 * The directory tree is the only source of truth; nothing is cached.
 */

#include "semverpp/common.hpp"
#include "semverpp/model.hpp"
#include "semverpp/semver.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace semverpp::store {

constexpr const char* kDirectoryName = ".semversioner";
constexpr const char* kLegacyDirectoryName = ".changes";
constexpr const char* kNextReleaseDirectoryName = "next-release";

struct Layout
{
    std::filesystem::path root;          ///< .semversioner or .changes
    std::filesystem::path next_release;  ///< Pending area
    bool legacy = false;                 ///< Using the deprecated directory name
};

/**
 * @brief Decide which directory a repository uses
 *
 * The legacy directory is used only when it exists and the current one does
 * not. Nothing is created here.
 */
[[nodiscard]] Layout detect_layout(const std::filesystem::path& base_path);

/**
 * @brief The pending-changes area
 */
class ChangesetStore
{
public:
    /// Clock used to name new changesets
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param now Clock for changeset names; the system clock when empty
     */
    ChangesetStore(Layout layout, std::filesystem::path schema_dir, TimeSource now = {});

    /**
     * @brief Persist a new changeset
     *
     * Safe under concurrent callers: the record is fully written to a hidden
     * staging file, then published with an exclusive hard link under
     * "{type}-{timestamp}.json". A name collision regenerates the timestamp.
     *
     * @return Path of the published file
     */
    [[nodiscard]] semverpp::Result<std::filesystem::path> create(const model::Changeset& change);

    /**
     * @brief All pending changesets, sorted by (type, description)
     * @return Empty when the pending area does not exist
     */
    [[nodiscard]] semverpp::Result<std::vector<model::Changeset>> list() const;

    /**
     * @brief Delete every pending changeset and, once empty, the directory
     *
     * Idempotent: an absent or empty area is not an error.
     */
    [[nodiscard]] semverpp::VoidResult clear();

    [[nodiscard]] bool is_using_legacy_layout() const noexcept { return m_layout.legacy; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept
    {
        return m_layout.next_release;
    }

private:
    Layout m_layout;
    std::filesystem::path m_schema_dir;
    TimeSource m_now;
};

/**
 * @brief The released-versions area (version history)
 */
class ReleaseStore
{
public:
    ReleaseStore(Layout layout, std::filesystem::path schema_dir);

    /**
     * @brief Write a new release record; an existing record is never replaced
     * @return Path of the written file
     */
    [[nodiscard]] semverpp::Result<std::filesystem::path> create(const model::Release& release);

    /**
     * @brief All releases, newest version first
     */
    [[nodiscard]] semverpp::Result<std::vector<model::Release>> list() const;

    /**
     * @brief Highest released version, or nullopt when nothing is released
     */
    [[nodiscard]] semverpp::Result<std::optional<semver::SemVersion>> last_version() const;

private:
    Layout m_layout;
    std::filesystem::path m_schema_dir;

    struct RecordFile
    {
        semver::SemVersion version;
        std::filesystem::path path;
        std::string identifier;
    };

    /// Release record files sorted by version, descending
    [[nodiscard]] semverpp::Result<std::vector<RecordFile>> list_record_files() const;
};

}  // namespace semverpp::store
