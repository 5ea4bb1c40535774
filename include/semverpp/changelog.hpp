#pragma once

/**
 * @file changelog.hpp
 * @brief Changelog rendering through text templates
 *
 * Templates use a Jinja subset:
 *   {{ path }}                          substitution (release.version, change.type)
 *   {% for x in path %}...{% endfor %}  iteration (also "for k, v in object")
 *   {% if [not] path %}...{% elif %}...{% else %}...{% endif %}
 *   {# comment #}
 * with Jinja's trim_blocks behaviour and "-" whitespace control.
 */

#include "semverpp/common.hpp"
#include "semverpp/model.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace semverpp::changelog {

// clang-format off
constexpr std::string_view kDefaultTemplate =
    "# Changelog\n"
    "Note: version releases in the 0.x.y range may introduce breaking changes.\n"
    "{% for release in releases %}\n"
    "\n"
    "## {{ release.version }}\n"
    "\n"
    "{% for change in release.changes %}\n"
    "- {{ change.type }}: {{ change.description }}\n"
    "{% endfor %}\n"
    "{% endfor %}\n";
// clang-format on

/**
 * Render a template against a JSON context
 * @return Rendered text, or TemplateError for malformed templates
 */
[[nodiscard]] semverpp::Result<std::string> render_template(std::string_view source,
                                                            const nlohmann::json& context);

/**
 * Build the render context: {"releases": [{version, created_at, changes}]}
 */
[[nodiscard]] nlohmann::json make_context(std::span<const model::Release> releases);

/**
 * Render releases (newest first) as a changelog
 *
 * @param releases Version history, newest first
 * @param version Only render this version; an unknown version renders no releases
 * @param source Template text
 */
[[nodiscard]] semverpp::Result<std::string>
generate(std::span<const model::Release> releases,
         const std::optional<std::string>& version = std::nullopt,
         std::string_view source = kDefaultTemplate);

/**
 * Read a custom template from disk
 * @return Template text, or TemplateNotFound
 */
[[nodiscard]] semverpp::Result<std::string> load_template(const std::filesystem::path& path);

}  // namespace semverpp::changelog
