/**
 * @file main.cpp
 * @brief semverpp CLI entry point
 *
 * Commands:
 *   add-change       Create a new changeset file
 *   release          Release a new version from the pending changes
 *   changelog        Print the changelog
 *   current-version  Show the current version
 *   next-version     Show the computed next version
 *   status           Show the status of the working directory
 *   check            Verify that changeset files exist
 *   version          Show version information
 */

#include "semverpp/require_cpp23.hpp"

#include "semverpp/changelog.hpp"
#include "semverpp/common.hpp"
#include "semverpp/release.hpp"
#include "semverpp/semver.hpp"
#include "semverpp/version.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

void print_version()
{
    std::println("semverpp {} ({})", semverpp::kVersion, semverpp::kBuildId);
    std::println("  changeset schema: {}", semverpp::kChangesetSchema);
    std::println("  release schema:   {}", semverpp::kReleaseSchema);
}

void print_help()
{
    std::print(R"(semverpp - Semantic versioning and changelog management

Usage: semverpp [global options] <command> [options]

Commands:
  add-change        Create a new changeset file
  release           Release a new version
  changelog         Print the changelog
  current-version   Show the current version
  next-version      Show computed next version
  status            Show the status of the working directory
  check             Verify changeset files exist
  version           Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information
  --path DIR          Base path (default: current directory)
  --schema-dir DIR    Path to schema directory

Run 'semverpp <command> --help' for command-specific options.
)");
}

void print_add_change_help()
{
    std::print(R"(Usage: semverpp add-change [options]

Create a new changeset file

Options:
  --type, -t TYPE             major, minor or patch (required)
  --description, -d TEXT      Change description (required)
  --pre CHANNEL               Prerelease channel: alpha, beta or rc
  --attribute, -a KEY=VALUE   Extra attribute (repeatable)
  --help, -h                  Show this help
)");
}

void print_changelog_help()
{
    std::print(R"(Usage: semverpp changelog [options]

Print the changelog

Options:
  --version V        Filter the changelog by version
  --template FILE    Path to a custom changelog template
  --help, -h         Show this help
)");
}

void print_simple_help(std::string_view command, std::string_view summary)
{
    std::print(R"(Usage: semverpp {}

{}

Options:
  --help, -h    Show this help
)",
               command,
               summary);
}

struct GlobalOptions
{
    std::filesystem::path base_path;
    std::filesystem::path schema_dir;
};

struct AddChangeOptions
{
    std::string type;
    std::string description;
    std::optional<std::string> pre;
    semverpp::model::Attributes attributes;
    bool show_help;
};

struct ChangelogOptions
{
    std::optional<std::string> version;
    std::optional<std::string> template_path;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> semverpp::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            semverpp::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] semverpp::VoidResult add_attribute(std::string_view pair,
                                                 semverpp::model::Attributes& attributes)
{
    const std::size_t eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return std::unexpected(semverpp::Error::make(
            "InvalidArgument",
            std::string("Attributes must be given as KEY=VALUE: ") + std::string(pair)));
    }
    attributes.insert_or_assign(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
    return {};
}

[[nodiscard]] semverpp::Result<AddChangeOptions> parse_add_change_args(std::span<char*> args)
{
    AddChangeOptions options{.type = std::string{},
                             .description = std::string{},
                             .pre = std::nullopt,
                             .attributes = {},
                             .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg != "--type" && arg != "-t" && arg != "--description" && arg != "-d"
            && arg != "--pre" && arg != "--attribute" && arg != "-a") {
            return std::unexpected(
                semverpp::Error::make("InvalidArgument",
                                      std::string("Unknown option: ") + std::string(arg)));
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        skip_next = true;
        if (arg == "--type" || arg == "-t") {
            options.type = std::move(*value);
        } else if (arg == "--description" || arg == "-d") {
            options.description = std::move(*value);
        } else if (arg == "--pre") {
            options.pre = std::move(*value);
        } else if (auto added = add_attribute(*value, options.attributes); !added) {
            return std::unexpected(added.error());
        }
    }
    return options;
}

[[nodiscard]] semverpp::Result<ChangelogOptions> parse_changelog_args(std::span<char*> args)
{
    ChangelogOptions options{.version = std::nullopt,
                             .template_path = std::nullopt,
                             .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.version = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--template") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.template_path = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(semverpp::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

/// Commands without options only understand --help.
[[nodiscard]] semverpp::Result<bool> parse_help_only(std::span<char*> args)
{
    bool show_help = false;
    for (char* arg_ptr : args) {
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            show_help = true;
            continue;
        }
        return std::unexpected(semverpp::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return show_help;
}

[[nodiscard]] semverpp::release::ReleaseCoordinator make_coordinator(const GlobalOptions& global)
{
    return semverpp::release::ReleaseCoordinator(
        semverpp::release::ProjectConfig{.base_path = global.base_path,
                                         .schema_dir = global.schema_dir});
}

void warn_if_deprecated(const semverpp::release::ReleaseCoordinator& coordinator)
{
    if (coordinator.is_deprecated()) {
        std::println(stderr,
                     "WARN deprecated Semversioner now uses '.semversioner' directory instead of "
                     "'.changes'. Please, rename it to remove this message.");
    }
}

[[nodiscard]] int report_error(const semverpp::Error& error)
{
    std::println(stderr, "Error: {}", error.message);
    return 1;
}

[[nodiscard]] int run_add_change(const GlobalOptions& global, const AddChangeOptions& options)
{
    auto type = semverpp::semver::parse_release_type(options.type);
    if (!type) {
        return report_error(type.error());
    }
    std::optional<semverpp::semver::Channel> pre;
    if (options.pre) {
        auto channel = semverpp::semver::parse_channel(*options.pre);
        if (!channel) {
            return report_error(channel.error());
        }
        pre = *channel;
    }

    auto coordinator = make_coordinator(global);
    warn_if_deprecated(coordinator);
    auto path = coordinator.add_change(*type, options.description, options.attributes, pre);
    if (!path) {
        return report_error(path.error());
    }
    std::println("Successfully created file {}", path->string());
    return 0;
}

[[nodiscard]] int run_release(const GlobalOptions& global)
{
    auto coordinator = make_coordinator(global);
    warn_if_deprecated(coordinator);
    auto result = coordinator.release();
    if (!result) {
        return report_error(result.error());
    }
    std::println("Releasing version: {} -> {}", result->previous_version, result->release.version);
    std::println("Generated '{}' file.", result->path.string());
    std::println("Removing '{}' directory.", coordinator.layout().next_release.string());
    std::println("Successfully created new release: {}", result->release.version);
    return 0;
}

[[nodiscard]] int run_changelog(const GlobalOptions& global, const ChangelogOptions& options)
{
    std::optional<std::string> source;
    if (options.template_path) {
        auto loaded = semverpp::changelog::load_template(*options.template_path);
        if (!loaded) {
            return report_error(loaded.error());
        }
        source = std::move(*loaded);
    }

    auto coordinator = make_coordinator(global);
    warn_if_deprecated(coordinator);
    auto text = coordinator.generate_changelog(options.version, source);
    if (!text) {
        return report_error(text.error());
    }
    std::print("{}", *text);
    return 0;
}

[[nodiscard]] int run_current_version(const GlobalOptions& global)
{
    auto coordinator = make_coordinator(global);
    auto version = coordinator.get_last_version();
    if (!version) {
        return report_error(version.error());
    }
    std::println("{}", *version);
    return 0;
}

[[nodiscard]] int run_next_version(const GlobalOptions& global)
{
    auto coordinator = make_coordinator(global);
    auto version = coordinator.get_next_version();
    if (!version) {
        return report_error(version.error());
    }
    if (!*version) {
        std::println(stderr, "Error: No changes found. No next version available.");
        return 1;
    }
    std::println("{}", **version);
    return 0;
}

[[nodiscard]] int run_status(const GlobalOptions& global)
{
    auto coordinator = make_coordinator(global);
    warn_if_deprecated(coordinator);
    auto status = coordinator.get_status();
    if (!status) {
        return report_error(status.error());
    }

    std::println("Version: {}", status->version);
    if (status->pending_changes.empty()) {
        std::println("No changes to release (use \"semverpp add-change\")");
        return 0;
    }
    std::println("Next version: {}", status->next_version.value_or(""));
    std::println("Unreleased changes:");
    for (const auto& change : status->pending_changes) {
        std::println("\t{}:\t{}", semverpp::semver::to_string(change.type), change.description);
    }
    std::println("(use \"semverpp release\" to release the next version)");
    return 0;
}

[[nodiscard]] int run_check(const GlobalOptions& global)
{
    auto coordinator = make_coordinator(global);
    auto pending = coordinator.check();
    if (!pending) {
        return report_error(pending.error());
    }
    if (!*pending) {
        std::println(stderr, "Error: No changes to release.");
        return 1;
    }
    std::println("OK");
    return 0;
}

int cmd_add_change(const GlobalOptions& global, std::span<char*> args)
{
    auto options = parse_add_change_args(args);
    if (!options) {
        return report_error(options.error());
    }
    if (options->show_help) {
        print_add_change_help();
        return 0;
    }
    if (options->type.empty() || options->description.empty()) {
        std::println(stderr, "Error: --type and --description are required");
        print_add_change_help();
        return 1;
    }
    return run_add_change(global, *options);
}

int cmd_changelog(const GlobalOptions& global, std::span<char*> args)
{
    auto options = parse_changelog_args(args);
    if (!options) {
        return report_error(options.error());
    }
    if (options->show_help) {
        print_changelog_help();
        return 0;
    }
    return run_changelog(global, *options);
}

template <typename Run>
int cmd_simple(std::span<char*> args, std::string_view command, std::string_view summary, Run run)
{
    auto show_help = parse_help_only(args);
    if (!show_help) {
        return report_error(show_help.error());
    }
    if (*show_help) {
        print_simple_help(command, summary);
        return 0;
    }
    return run();
}

/// Consume global options; returns the index of the command word.
[[nodiscard]] semverpp::Result<std::size_t> parse_global_args(std::span<char*> args,
                                                              GlobalOptions& global)
{
    std::size_t idx = 1;
    while (idx < args.size() && args[idx] != nullptr) {
        std::string_view arg(args[idx]);
        if (arg != "--path" && arg != "--schema-dir") {
            break;
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--path") {
            global.base_path = *value;
        } else {
            global.schema_dir = *value;
        }
        idx += 2;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(global.base_path, ec)) {
        return std::unexpected(semverpp::Error::make(
            "InvalidArgument",
            std::string("Path does not exist or is not a directory: ") + global.base_path.string()));
    }
    return idx;
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
        GlobalOptions global{.base_path = std::filesystem::current_path(),
                             .schema_dir = semverpp::common::default_schema_dir()};
        auto command_index = parse_global_args(args, global);
        if (!command_index) {
            return report_error(command_index.error());
        }
        if (*command_index >= args.size()) {
            print_help();
            return 1;
        }

        std::string_view cmd = args[*command_index];
        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        auto sub_args = args.subspan(*command_index + 1);

        if (cmd == "add-change") {
            return cmd_add_change(global, sub_args);
        }
        if (cmd == "release") {
            return cmd_simple(sub_args, cmd, "Release a new version.", [&] {
                return run_release(global);
            });
        }
        if (cmd == "changelog") {
            return cmd_changelog(global, sub_args);
        }
        if (cmd == "current-version") {
            return cmd_simple(sub_args, cmd, "Show the current version.", [&] {
                return run_current_version(global);
            });
        }
        if (cmd == "next-version") {
            return cmd_simple(sub_args, cmd, "Show computed next version.", [&] {
                return run_next_version(global);
            });
        }
        if (cmd == "status") {
            return cmd_simple(sub_args, cmd, "Show the status of the working directory.", [&] {
                return run_status(global);
            });
        }
        if (cmd == "check") {
            return cmd_simple(sub_args, cmd, "Verifies changeset files exist.", [&] {
                return run_check(global);
            });
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
