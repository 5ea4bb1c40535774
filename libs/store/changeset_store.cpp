/**
 * @file changeset_store.cpp
 * @brief Pending changeset area: concurrent-safe creation, listing, clearing
 */

#include "semverpp/schema_validate.hpp"
#include "semverpp/store.hpp"
#include "semverpp/version.hpp"

#include "json_io.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <string>
#include <system_error>
#include <utility>

namespace semverpp::store {

namespace {

namespace fs = std::filesystem;

/// Names tried before giving up when the clock does not advance
constexpr int kMaxPublishAttempts = 1000;

[[nodiscard]] fs::path candidate_path(const fs::path& dir,
                                      semver::ReleaseType type,
                                      std::chrono::system_clock::time_point now)
{
    const auto stamp = common::format_compact_timestamp(now);
    return dir / std::format("{}-{}.json", semver::to_string(type), stamp);
}

[[nodiscard]] bool is_directory(const fs::path& path)
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

}  // namespace

Layout detect_layout(const fs::path& base_path)
{
    const fs::path current = base_path / kDirectoryName;
    const fs::path legacy = base_path / kLegacyDirectoryName;

    if (is_directory(legacy) && !is_directory(current)) {
        return Layout{.root = legacy,
                      .next_release = legacy / kNextReleaseDirectoryName,
                      .legacy = true};
    }
    return Layout{.root = current,
                  .next_release = current / kNextReleaseDirectoryName,
                  .legacy = false};
}

ChangesetStore::ChangesetStore(Layout layout, fs::path schema_dir, TimeSource now)
    : m_layout(std::move(layout))
    , m_schema_dir(std::move(schema_dir))
    , m_now(std::move(now))
{
    if (!m_now) {
        m_now = [] { return std::chrono::system_clock::now(); };
    }
}

semverpp::Result<fs::path> ChangesetStore::create(const model::Changeset& change)
{
    const nlohmann::json payload = model::to_json(change);
    const fs::path schema_file = common::schema_path(m_schema_dir, kChangesetSchema);
    if (auto result = common::validate_json(payload, schema_file); !result) {
        return std::unexpected(result.error());
    }

    if (auto result = ensure_directory(m_layout.next_release); !result) {
        return std::unexpected(result.error());
    }

    auto staging = stage_file(m_layout.next_release, render_record(payload));
    if (!staging) {
        return std::unexpected(staging.error());
    }

    // The hard link is the exclusive create: it fails if the name is taken,
    // and the record is complete before its name becomes visible.
    fs::path published;
    std::error_code link_ec;
    for (int attempt = 0; attempt < kMaxPublishAttempts; ++attempt) {
        published = candidate_path(m_layout.next_release, change.type, m_now());
        fs::create_hard_link(*staging, published, link_ec);
        if (link_ec != std::errc::file_exists) {
            break;
        }
    }
    if (link_ec) {
        std::error_code cleanup_ec;
        fs::remove(*staging, cleanup_ec);
        return std::unexpected(io_error("Failed to publish changeset", published, link_ec));
    }

    std::error_code ec;
    fs::remove(*staging, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to remove staging file", *staging, ec));
    }
    fs::path absolute = fs::absolute(published, ec);
    if (ec) {
        return published;
    }
    return absolute;
}

semverpp::Result<std::vector<model::Changeset>> ChangesetStore::list() const
{
    std::vector<model::Changeset> changes;
    if (!is_directory(m_layout.next_release)) {
        return changes;
    }

    auto entries = list_directory(m_layout.next_release);
    if (!entries) {
        return std::unexpected(entries.error());
    }

    const fs::path schema_file = common::schema_path(m_schema_dir, kChangesetSchema);
    for (const auto& entry : *entries) {
        std::error_code ec;
        if (entry.is_directory(ec) || is_hidden_entry(entry.path())) {
            continue;
        }
        auto payload = read_json_file(entry.path());
        if (!payload) {
            return std::unexpected(payload.error());
        }
        if (auto result = common::validate_json(*payload, schema_file); !result) {
            return std::unexpected(Error::make(result.error().code,
                                               std::format("Changeset {} is invalid: {}",
                                                           entry.path().string(),
                                                           result.error().message)));
        }
        auto change = model::changeset_from_json(*payload, entry.path().filename().string());
        if (!change) {
            return std::unexpected(change.error());
        }
        changes.push_back(std::move(*change));
    }

    model::sort_changesets(changes);
    return changes;
}

semverpp::VoidResult ChangesetStore::clear()
{
    if (!is_directory(m_layout.next_release)) {
        return {};
    }

    auto entries = list_directory(m_layout.next_release);
    if (!entries) {
        return std::unexpected(entries.error());
    }
    for (const auto& entry : *entries) {
        std::error_code ec;
        if (entry.is_directory(ec)) {
            continue;
        }
        fs::remove(entry.path(), ec);
        if (ec) {
            return std::unexpected(io_error("Failed to remove", entry.path(), ec));
        }
    }

    std::error_code ec;
    const bool empty = fs::is_empty(m_layout.next_release, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to inspect", m_layout.next_release, ec));
    }
    if (empty) {
        fs::remove(m_layout.next_release, ec);
        if (ec) {
            return std::unexpected(io_error("Failed to remove", m_layout.next_release, ec));
        }
    }
    return {};
}

}  // namespace semverpp::store
