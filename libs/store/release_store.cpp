/**
 * @file release_store.cpp
 * @brief Released-versions area: record writing and version-history scan
 */

#include "semverpp/schema_validate.hpp"
#include "semverpp/store.hpp"
#include "semverpp/version.hpp"

#include "json_io.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <string>
#include <system_error>

namespace semverpp::store {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kRecordExtension = ".json";

[[nodiscard]] std::string release_identifier(const fs::path& path)
{
    std::string name = path.filename().string();
    if (name.ends_with(kRecordExtension)) {
        name.resize(name.size() - kRecordExtension.size());
    }
    return name;
}

}  // namespace

ReleaseStore::ReleaseStore(Layout layout, fs::path schema_dir)
    : m_layout(std::move(layout))
    , m_schema_dir(std::move(schema_dir))
{}

semverpp::Result<fs::path> ReleaseStore::create(const model::Release& release)
{
    auto version = semver::SemVersion::parse(release.version);
    if (!version) {
        return std::unexpected(version.error());
    }

    const nlohmann::json payload = model::to_json(release);
    if (auto result =
            common::validate_json(payload, common::schema_path(m_schema_dir, kReleaseSchema));
        !result) {
        return std::unexpected(result.error());
    }

    if (auto result = ensure_directory(m_layout.root); !result) {
        return std::unexpected(result.error());
    }

    auto staging = stage_file(m_layout.root, render_record(payload));
    if (!staging) {
        return std::unexpected(staging.error());
    }

    // Only a complete record ever appears under the version's name.
    const fs::path path = m_layout.root / (version->to_string() + std::string(kRecordExtension));
    std::error_code ec;
    fs::create_hard_link(*staging, path, ec);
    std::error_code cleanup_ec;
    fs::remove(*staging, cleanup_ec);
    if (ec == std::errc::file_exists) {
        return std::unexpected(io_error("Release record already exists:", path));
    }
    if (ec) {
        return std::unexpected(io_error("Failed to publish release record", path, ec));
    }
    if (cleanup_ec) {
        return std::unexpected(io_error("Failed to remove staging file", *staging, cleanup_ec));
    }
    return path;
}

semverpp::Result<std::vector<ReleaseStore::RecordFile>> ReleaseStore::list_record_files() const
{
    std::vector<RecordFile> records;
    std::error_code ec;
    if (!fs::is_directory(m_layout.root, ec)) {
        return records;
    }

    auto entries = list_directory(m_layout.root);
    if (!entries) {
        return std::unexpected(entries.error());
    }

    for (const auto& entry : *entries) {
        if (!entry.is_regular_file(ec) || is_hidden_entry(entry.path())) {
            continue;
        }
        std::string identifier = release_identifier(entry.path());
        auto version = semver::SemVersion::parse(identifier);
        if (!version) {
            return std::unexpected(
                Error::make(version.error().code,
                            std::format("Release record {} is not named by a version: {}",
                                        entry.path().string(),
                                        version.error().message)));
        }
        records.push_back(RecordFile{.version = *version,
                                     .path = entry.path(),
                                     .identifier = std::move(identifier)});
    }

    std::ranges::sort(records, std::ranges::greater{}, &RecordFile::version);
    return records;
}

semverpp::Result<std::vector<model::Release>> ReleaseStore::list() const
{
    auto records = list_record_files();
    if (!records) {
        return std::unexpected(records.error());
    }

    std::vector<model::Release> releases;
    releases.reserve(records->size());
    for (const auto& record : *records) {
        auto payload = read_json_file(record.path);
        if (!payload) {
            return std::unexpected(payload.error());
        }

        auto format = model::detect_release_format(*payload);
        if (!format) {
            return std::unexpected(Error::make(
                format.error().code,
                std::format("Release record {}: {}", record.path.string(), format.error().message)));
        }
        const char* schema =
            *format == model::ReleaseFormat::kCurrent ? kReleaseSchema : kReleaseLegacySchema;
        if (auto result =
                common::validate_json(*payload, common::schema_path(m_schema_dir, schema));
            !result) {
            return std::unexpected(Error::make(result.error().code,
                                               std::format("Release record {} is invalid: {}",
                                                           record.path.string(),
                                                           result.error().message)));
        }

        auto release = model::release_from_json(*payload, record.identifier);
        if (!release) {
            return std::unexpected(release.error());
        }
        releases.push_back(std::move(*release));
    }
    return releases;
}

semverpp::Result<std::optional<semver::SemVersion>> ReleaseStore::last_version() const
{
    auto records = list_record_files();
    if (!records) {
        return std::unexpected(records.error());
    }
    if (records->empty()) {
        return std::optional<semver::SemVersion>{};
    }
    return std::optional<semver::SemVersion>{records->front().version};
}

}  // namespace semverpp::store
