/**
 * @file test_cli_e2e.cpp
 * @brief End-to-end tests driving the semverpp binary
 */

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>

#include <sys/wait.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

struct CommandResult
{
    int exit_code;
    std::string out;
    std::string err;
};

[[nodiscard]] std::string quote_path(const fs::path& path)
{
    return std::format("\"{}\"", path.string());
}

[[nodiscard]] std::string read_file(const fs::path& path)
{
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

/// Run the CLI against a project directory, capturing stdout and stderr.
[[nodiscard]] CommandResult run_semverpp(const TempDir& project, const std::string& args)
{
    const fs::path binary = fs::path(SEMVERPP_BIN_DIR) / "semverpp";
    const fs::path out_file = project.path() / ".." / (project.path().filename().string() + ".out");
    const fs::path err_file = project.path() / ".." / (project.path().filename().string() + ".err");
    const std::string command = std::format("{} --path {} --schema-dir {} {} > {} 2> {}",
                                            quote_path(binary),
                                            quote_path(project.path()),
                                            quote_path(SEMVERPP_SCHEMA_DIR),
                                            args,
                                            quote_path(out_file),
                                            quote_path(err_file));
    const int status = std::system(command.c_str());
    CommandResult result{.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1,
                         .out = read_file(out_file),
                         .err = read_file(err_file)};
    std::error_code ec;
    fs::remove(out_file, ec);
    fs::remove(err_file, ec);
    return result;
}

}  // namespace

TEST(CliEndToEndTest, VersionAndHelp)
{
    TempDir project("semverpp_e2e_version");
    auto version = run_semverpp(project, "version");
    EXPECT_EQ(version.exit_code, 0);
    EXPECT_TRUE(version.out.starts_with("semverpp ")) << version.out;

    auto help = run_semverpp(project, "--help");
    EXPECT_EQ(help.exit_code, 0);
    EXPECT_NE(help.out.find("add-change"), std::string::npos);
}

TEST(CliEndToEndTest, FullReleaseWorkflow)
{
    TempDir project("semverpp_e2e_workflow");

    auto current = run_semverpp(project, "current-version");
    EXPECT_EQ(current.exit_code, 0);
    EXPECT_EQ(current.out, "0.0.0\n");

    auto check = run_semverpp(project, "check");
    EXPECT_EQ(check.exit_code, 1);
    EXPECT_NE(check.err.find("No changes to release."), std::string::npos);

    auto next = run_semverpp(project, "next-version");
    EXPECT_EQ(next.exit_code, 1);
    EXPECT_NE(next.err.find("No next version available"), std::string::npos);

    auto added = run_semverpp(project, "add-change --type minor --description \"New feature\"");
    ASSERT_EQ(added.exit_code, 0) << added.err;
    EXPECT_TRUE(added.out.starts_with("Successfully created file ")) << added.out;

    added = run_semverpp(project, "add-change -t patch -d \"Small fix\" -a issue=42");
    ASSERT_EQ(added.exit_code, 0) << added.err;

    check = run_semverpp(project, "check");
    EXPECT_EQ(check.exit_code, 0);
    EXPECT_EQ(check.out, "OK\n");

    next = run_semverpp(project, "next-version");
    EXPECT_EQ(next.exit_code, 0);
    EXPECT_EQ(next.out, "0.1.0\n");

    auto status = run_semverpp(project, "status");
    EXPECT_EQ(status.exit_code, 0);
    EXPECT_EQ(status.out,
              "Version: 0.0.0\n"
              "Next version: 0.1.0\n"
              "Unreleased changes:\n"
              "\tminor:\tNew feature\n"
              "\tpatch:\tSmall fix\n"
              "(use \"semverpp release\" to release the next version)\n");

    auto release = run_semverpp(project, "release");
    ASSERT_EQ(release.exit_code, 0) << release.err;
    EXPECT_TRUE(release.out.starts_with("Releasing version: 0.0.0 -> 0.1.0\n")) << release.out;
    EXPECT_NE(release.out.find("Successfully created new release: 0.1.0"), std::string::npos);

    const fs::path record = project.path() / ".semversioner" / "0.1.0.json";
    ASSERT_TRUE(fs::exists(record));
    const auto json = nlohmann::json::parse(read_file(record));
    EXPECT_EQ(json.at("version"), "0.1.0");
    EXPECT_EQ(json.at("changes").size(), 2U);
    EXPECT_EQ(json.at("changes").at(1).at("attributes").at("issue"), "42");
    EXPECT_FALSE(fs::exists(project.path() / ".semversioner" / "next-release"));

    auto changelog = run_semverpp(project, "changelog");
    EXPECT_EQ(changelog.exit_code, 0);
    EXPECT_EQ(changelog.out,
              "# Changelog\n"
              "Note: version releases in the 0.x.y range may introduce breaking changes.\n"
              "\n"
              "## 0.1.0\n"
              "\n"
              "- minor: New feature\n"
              "- patch: Small fix\n");

    auto again = run_semverpp(project, "release");
    EXPECT_EQ(again.exit_code, 1);
    EXPECT_NE(again.err.find("No changes to release"), std::string::npos);
}

TEST(CliEndToEndTest, ChangelogWithCustomTemplate)
{
    TempDir project("semverpp_e2e_template");
    ASSERT_EQ(run_semverpp(project, "add-change -t major -d Initial").exit_code, 0);
    ASSERT_EQ(run_semverpp(project, "release").exit_code, 0);

    const fs::path template_path = project.path() / "changelog.j2";
    {
        std::ofstream out(template_path);
        out << "{% for release in releases %}v{{ release.version }};{% endfor %}";
    }
    auto changelog =
        run_semverpp(project, std::format("changelog --template {}", quote_path(template_path)));
    EXPECT_EQ(changelog.exit_code, 0) << changelog.err;
    EXPECT_EQ(changelog.out, "v1.0.0;");

    auto filtered = run_semverpp(project, "changelog --version 9.9.9");
    EXPECT_EQ(filtered.exit_code, 0);
    EXPECT_EQ(filtered.out,
              "# Changelog\n"
              "Note: version releases in the 0.x.y range may introduce breaking changes.\n");

    auto missing = run_semverpp(project, "changelog --template nowhere.j2");
    EXPECT_EQ(missing.exit_code, 1);
    EXPECT_NE(missing.err.find("Template not found"), std::string::npos);
}

TEST(CliEndToEndTest, PrereleaseChanges)
{
    TempDir project("semverpp_e2e_prerelease");
    ASSERT_EQ(run_semverpp(project, "add-change -t minor -d Preview --pre beta").exit_code, 0);
    auto next = run_semverpp(project, "next-version");
    EXPECT_EQ(next.out, "0.1.0-beta.1\n");

    ASSERT_EQ(run_semverpp(project, "add-change -t patch -d Stable").exit_code, 0);
    auto mixed = run_semverpp(project, "next-version");
    EXPECT_EQ(mixed.exit_code, 1);
    EXPECT_TRUE(mixed.err.starts_with("Error: ")) << mixed.err;
}

TEST(CliEndToEndTest, RejectsInvalidInput)
{
    TempDir project("semverpp_e2e_invalid");
    auto bad_type = run_semverpp(project, "add-change -t huge -d x");
    EXPECT_EQ(bad_type.exit_code, 1);
    EXPECT_NE(bad_type.err.find("huge"), std::string::npos);

    auto missing = run_semverpp(project, "add-change -t patch");
    EXPECT_EQ(missing.exit_code, 1);

    auto unknown = run_semverpp(project, "frobnicate");
    EXPECT_EQ(unknown.exit_code, 1);
    EXPECT_NE(unknown.err.find("Unknown command"), std::string::npos);

    EXPECT_FALSE(fs::exists(project.path() / ".semversioner"));
}

TEST(CliEndToEndTest, LegacyDirectoryWarning)
{
    TempDir project("semverpp_e2e_legacy");
    fs::create_directories(project.path() / ".changes");
    auto status = run_semverpp(project, "status");
    EXPECT_EQ(status.exit_code, 0);
    EXPECT_NE(status.err.find("'.changes'"), std::string::npos);
    EXPECT_NE(status.out.find("No changes to release"), std::string::npos);
}
