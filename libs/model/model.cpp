/**
 * @file model.cpp
 * @brief Changeset / Release JSON mapping
 */

#include "semverpp/model.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <tuple>

namespace semverpp::model {

namespace {

[[nodiscard]] semverpp::Error parse_error(std::string_view source, std::string_view reason)
{
    return Error::make(std::string(error_code::kParseError),
                       std::format("Malformed record {}: {}", source, reason));
}

[[nodiscard]] semverpp::Result<std::vector<Changeset>> changes_from_json(const nlohmann::json& j,
                                                                        std::string_view source)
{
    if (!j.is_array()) {
        return std::unexpected(parse_error(source, "changes must be an array"));
    }
    std::vector<Changeset> changes;
    changes.reserve(j.size());
    for (const auto& entry : j) {
        auto change = changeset_from_json(entry, source);
        if (!change) {
            return std::unexpected(change.error());
        }
        changes.push_back(std::move(*change));
    }
    sort_changesets(changes);
    return changes;
}

[[nodiscard]] semverpp::Result<std::string> canonical_version(std::string_view text)
{
    auto version = semver::SemVersion::parse(text);
    if (!version) {
        return std::unexpected(version.error());
    }
    return version->to_string();
}

}  // namespace

bool changeset_less(const Changeset& a, const Changeset& b)
{
    return std::tuple{semver::to_string(a.type), std::string_view(a.description)}
           < std::tuple{semver::to_string(b.type), std::string_view(b.description)};
}

void sort_changesets(std::vector<Changeset>& changes)
{
    std::ranges::stable_sort(changes, changeset_less);
}

nlohmann::json to_json(const Changeset& change)
{
    nlohmann::json j = {
        {       "type", std::string(semver::to_string(change.type))},
        {"description",                          change.description}
    };
    if (!change.attributes.empty()) {
        j["attributes"] = change.attributes;
    }
    if (change.pre) {
        j["pre"] = std::string(semver::to_string(*change.pre));
    }
    return j;
}

nlohmann::json to_json(const Release& release)
{
    nlohmann::json changes = nlohmann::json::array();
    for (const auto& change : release.changes) {
        changes.push_back(to_json(change));
    }
    return nlohmann::json{
        {   "version",                                                   release.version},
        {"created_at",
         release.created_at ? nlohmann::json(common::format_iso8601(*release.created_at))
                            : nlohmann::json(nullptr)                                  },
        {   "changes",                                                           changes}
    };
}

semverpp::Result<Changeset> changeset_from_json(const nlohmann::json& j, std::string_view source)
{
    if (!j.is_object()) {
        return std::unexpected(parse_error(source, "changeset must be an object"));
    }
    if (!j.contains("type") || !j.at("type").is_string()) {
        return std::unexpected(parse_error(source, "missing string field 'type'"));
    }
    if (!j.contains("description") || !j.at("description").is_string()) {
        return std::unexpected(parse_error(source, "missing string field 'description'"));
    }

    auto type = semver::parse_release_type(j.at("type").get<std::string>());
    if (!type) {
        return std::unexpected(parse_error(source, type.error().message));
    }

    Changeset change{.type = *type,
                     .description = j.at("description").get<std::string>(),
                     .attributes = {},
                     .pre = std::nullopt};

    if (j.contains("attributes") && !j.at("attributes").is_null()) {
        const auto& attributes = j.at("attributes");
        if (!attributes.is_object()) {
            return std::unexpected(parse_error(source, "'attributes' must be an object"));
        }
        for (const auto& [key, value] : attributes.items()) {
            if (!value.is_string()) {
                return std::unexpected(
                    parse_error(source, std::format("attribute '{}' must be a string", key)));
            }
            change.attributes.emplace(key, value.get<std::string>());
        }
    }

    if (j.contains("pre") && !j.at("pre").is_null()) {
        if (!j.at("pre").is_string()) {
            return std::unexpected(parse_error(source, "'pre' must be a string"));
        }
        // Stored records use the canonical channel names only.
        const auto text = j.at("pre").get<std::string>();
        auto channel = semver::parse_channel(text);
        if (!channel || semver::to_string(*channel) != text) {
            return std::unexpected(parse_error(
                source, std::format("'pre' must be one of alpha, beta or rc, got '{}'", text)));
        }
        change.pre = *channel;
    }

    return change;
}

semverpp::Result<ReleaseFormat> detect_release_format(const nlohmann::json& j)
{
    if (j.is_array()) {
        return ReleaseFormat::kLegacy;
    }
    if (j.is_object()
        && (j.contains("changes") || j.contains("version") || j.contains("created_at"))) {
        return ReleaseFormat::kCurrent;
    }
    return std::unexpected(
        Error::make(std::string(error_code::kParseError),
                    "Release record is neither a change array nor a release object"));
}

semverpp::Result<Release> release_from_json(const nlohmann::json& j,
                                            std::string_view release_identifier)
{
    auto format = detect_release_format(j);
    if (!format) {
        return std::unexpected(parse_error(release_identifier, format.error().message));
    }

    if (*format == ReleaseFormat::kLegacy) {
        auto version = canonical_version(release_identifier);
        if (!version) {
            return std::unexpected(version.error());
        }
        auto changes = changes_from_json(j, release_identifier);
        if (!changes) {
            return std::unexpected(changes.error());
        }
        return Release{.version = std::move(*version),
                       .changes = std::move(*changes),
                       .created_at = std::nullopt};
    }

    std::string version_text(release_identifier);
    if (j.contains("version")) {
        if (!j.at("version").is_string()) {
            return std::unexpected(parse_error(release_identifier, "'version' must be a string"));
        }
        version_text = j.at("version").get<std::string>();
    }
    auto version = canonical_version(version_text);
    if (!version) {
        return std::unexpected(version.error());
    }

    std::optional<common::SysSeconds> created_at;
    if (j.contains("created_at") && !j.at("created_at").is_null()) {
        if (!j.at("created_at").is_string()) {
            return std::unexpected(
                parse_error(release_identifier, "'created_at' must be a string or null"));
        }
        auto parsed = common::parse_iso8601(j.at("created_at").get<std::string>());
        if (!parsed) {
            return std::unexpected(parse_error(release_identifier, parsed.error().message));
        }
        created_at = *parsed;
    }

    if (!j.contains("changes")) {
        return std::unexpected(parse_error(release_identifier, "missing field 'changes'"));
    }
    auto changes = changes_from_json(j.at("changes"), release_identifier);
    if (!changes) {
        return std::unexpected(changes.error());
    }

    return Release{.version = std::move(*version),
                   .changes = std::move(*changes),
                   .created_at = created_at};
}

}  // namespace semverpp::model
