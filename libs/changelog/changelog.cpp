/**
 * @file changelog.cpp
 * @brief Changelog context building and rendering
 */

#include "semverpp/changelog.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace semverpp::changelog {

namespace {

/// Versions given on the command line may use any accepted spelling.
[[nodiscard]] std::string canonical_filter(const std::string& version)
{
    auto parsed = semver::SemVersion::parse(version);
    return parsed ? parsed->to_string() : version;
}

[[nodiscard]] nlohmann::json change_context(const model::Changeset& change)
{
    nlohmann::json j = model::to_json(change);
    if (!j.contains("attributes")) {
        j["attributes"] = nlohmann::json::object();
    }
    if (!j.contains("pre")) {
        j["pre"] = nullptr;
    }
    return j;
}

}  // namespace

nlohmann::json make_context(std::span<const model::Release> releases)
{
    nlohmann::json list = nlohmann::json::array();
    for (const auto& release : releases) {
        nlohmann::json changes = nlohmann::json::array();
        for (const auto& change : release.changes) {
            changes.push_back(change_context(change));
        }
        nlohmann::json entry = {
            {"version", release.version},
            {"changes", std::move(changes)},
        };
        entry["created_at"] = release.created_at
                                  ? nlohmann::json(common::format_iso8601(*release.created_at))
                                  : nlohmann::json(nullptr);
        list.push_back(std::move(entry));
    }
    return nlohmann::json{
        {"releases", std::move(list)}
    };
}

semverpp::Result<std::string> generate(std::span<const model::Release> releases,
                                       const std::optional<std::string>& version,
                                       std::string_view source)
{
    if (!version) {
        return render_template(source, make_context(releases));
    }

    const std::string wanted = canonical_filter(*version);
    std::vector<model::Release> selected;
    std::ranges::copy_if(releases, std::back_inserter(selected), [&](const model::Release& r) {
        return r.version == wanted;
    });
    return render_template(source, make_context(selected));
}

semverpp::Result<std::string> load_template(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error::make(std::string(error_code::kTemplateNotFound),
                                           std::format("Template not found: {}", path.string())));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(
            Error::make(std::string(error_code::kTemplateNotFound),
                        std::format("Failed to read template: {}", path.string())));
    }
    return buffer.str();
}

}  // namespace semverpp::changelog
