/**
 * @file test_release_store.cpp
 * @brief Released-versions area: record writing and version history
 */

#include "semverpp/store.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace semverpp::store::test {

namespace {

namespace fs = std::filesystem;

using semver::ReleaseType;

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

[[nodiscard]] ReleaseStore make_store(const fs::path& base)
{
    return ReleaseStore(detect_layout(base), SEMVERPP_SCHEMA_DIR);
}

[[nodiscard]] model::Changeset change(ReleaseType type, std::string description)
{
    return model::Changeset{.type = type,
                            .description = std::move(description),
                            .attributes = {},
                            .pre = std::nullopt};
}

void write_file(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

[[nodiscard]] std::string read_file(const fs::path& path)
{
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

/// Run body in a child process whose writes beyond limit_bytes fail with EFBIG.
/// @return The child's exit status, -1 if it did not exit normally
template <typename Body>
[[nodiscard]] int run_with_file_size_limit(rlim_t limit_bytes, Body body)
{
    const pid_t pid = ::fork();
    if (pid == 0) {
        std::signal(SIGXFSZ, SIG_IGN);
        ::alarm(30);
        rlimit limit{};
        ::getrlimit(RLIMIT_FSIZE, &limit);
        limit.rlim_cur = limit_bytes;
        if (::setrlimit(RLIMIT_FSIZE, &limit) != 0) {
            ::_exit(100);
        }
        ::_exit(body());
    }
    int status = 0;
    ::waitpid(pid, &status, 0);
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

}  // namespace

TEST(ReleaseStoreTest, EmptyHistory)
{
    TempDir temp_dir("semverpp_release_empty");
    auto store = make_store(temp_dir.path());

    auto releases = store.list();
    ASSERT_TRUE(releases) << releases.error().message;
    EXPECT_TRUE(releases->empty());

    auto last = store.last_version();
    ASSERT_TRUE(last) << last.error().message;
    EXPECT_FALSE(last->has_value());
}

TEST(ReleaseStoreTest, CreateWritesCurrentFormat)
{
    TempDir temp_dir("semverpp_release_create");
    auto store = make_store(temp_dir.path());

    const model::Release release{
        .version = "1.0.0",
        .changes = {change(ReleaseType::kMajor, "First")},
        .created_at = std::chrono::sys_days{std::chrono::year{2024} / 3 / 5}
                      + std::chrono::hours{13} + std::chrono::minutes{7} + std::chrono::seconds{9},
    };
    auto path = store.create(release);
    ASSERT_TRUE(path) << path.error().message;
    EXPECT_EQ(*path, temp_dir.path() / ".semversioner" / "1.0.0.json");
    EXPECT_EQ(read_file(*path),
              "{\n"
              "  \"changes\": [\n"
              "    {\n"
              "      \"description\": \"First\",\n"
              "      \"type\": \"major\"\n"
              "    }\n"
              "  ],\n"
              "  \"created_at\": \"2024-03-05T13:07:09Z\",\n"
              "  \"version\": \"1.0.0\"\n"
              "}\n");
}

TEST(ReleaseStoreTest, RoundTripsAtSecondPrecision)
{
    TempDir temp_dir("semverpp_release_round_trip");
    auto store = make_store(temp_dir.path());

    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    const model::Release release{
        .version = "0.2.0",
        .changes = {change(ReleaseType::kMinor, "a"), change(ReleaseType::kPatch, "b")},
        .created_at = now,
    };
    ASSERT_TRUE(store.create(release));

    auto releases = store.list();
    ASSERT_TRUE(releases) << releases.error().message;
    ASSERT_EQ(releases->size(), 1U);
    EXPECT_EQ(releases->front(), release);
}

TEST(ReleaseStoreTest, CreateNeverReplacesExistingRecord)
{
    TempDir temp_dir("semverpp_release_no_replace");
    auto store = make_store(temp_dir.path());
    const model::Release release{.version = "1.0.0",
                                 .changes = {change(ReleaseType::kMajor, "First")},
                                 .created_at = std::nullopt};
    ASSERT_TRUE(store.create(release));

    auto again = store.create(release);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, error_code::kIoError);
}

TEST(ReleaseStoreTest, FailedWriteLeavesHistoryReadable)
{
    TempDir temp_dir("semverpp_release_write_failure");
    const fs::path base = temp_dir.path();
    {
        auto store = make_store(base);
        ASSERT_TRUE(store.create(model::Release{.version = "0.1.0",
                                                .changes = {change(ReleaseType::kMinor, "small")},
                                                .created_at = std::nullopt}));
    }

    const int status = run_with_file_size_limit(64, [&base] {
        auto store = make_store(base);
        auto created = store.create(
            model::Release{.version = "1.0.0",
                           .changes = {change(ReleaseType::kMajor, std::string(64 * 1024, 'x'))},
                           .created_at = std::nullopt});
        if (created) {
            return 1;
        }
        return created.error().code == error_code::kIoError ? 0 : 2;
    });
    ASSERT_EQ(status, 0);

    const fs::path root = detect_layout(base).root;
    EXPECT_FALSE(fs::exists(root / "1.0.0.json"));
    for (const auto& entry : fs::directory_iterator(root)) {
        EXPECT_FALSE(entry.path().filename().string().starts_with(".")) << entry.path();
    }

    auto store = make_store(base);
    auto releases = store.list();
    ASSERT_TRUE(releases) << releases.error().message;
    ASSERT_EQ(releases->size(), 1U);
    EXPECT_EQ(releases->front().version, "0.1.0");
    auto last = store.last_version();
    ASSERT_TRUE(last);
    ASSERT_TRUE(*last);
    EXPECT_EQ((*last)->to_string(), "0.1.0");
}

TEST(ReleaseStoreTest, HistoryIsNewestFirstByVersionOrder)
{
    TempDir temp_dir("semverpp_release_order");
    auto store = make_store(temp_dir.path());
    for (const char* version : {"0.9.0", "0.10.0", "0.10.0-rc.1", "0.2.1"}) {
        ASSERT_TRUE(store.create(model::Release{.version = version,
                                                .changes = {change(ReleaseType::kPatch, "x")},
                                                .created_at = std::nullopt}));
    }

    auto releases = store.list();
    ASSERT_TRUE(releases) << releases.error().message;
    std::vector<std::string> versions;
    for (const auto& release : *releases) {
        versions.push_back(release.version);
    }
    EXPECT_EQ(versions, (std::vector<std::string>{"0.10.0", "0.10.0-rc.1", "0.9.0", "0.2.1"}));

    auto last = store.last_version();
    ASSERT_TRUE(last);
    ASSERT_TRUE(last->has_value());
    EXPECT_EQ((*last)->to_string(), "0.10.0");
}

TEST(ReleaseStoreTest, ReadsLegacyArrayRecords)
{
    TempDir temp_dir("semverpp_release_legacy_format");
    auto store = make_store(temp_dir.path());
    write_file(temp_dir.path() / ".semversioner" / "1.1.0.json",
               R"([{"type": "patch", "description": "b"}, {"type": "minor", "description": "a"}])");
    write_file(temp_dir.path() / ".semversioner" / "1.2.0alpha1.json",
               R"({"version": "1.2.0alpha1", "created_at": null, "changes": []})");

    auto releases = store.list();
    ASSERT_TRUE(releases) << releases.error().message;
    ASSERT_EQ(releases->size(), 2U);

    EXPECT_EQ((*releases)[0].version, "1.2.0-alpha.1");
    EXPECT_TRUE((*releases)[0].changes.empty());
    EXPECT_FALSE((*releases)[0].created_at.has_value());

    const model::Release expected{
        .version = "1.1.0",
        .changes = {change(ReleaseType::kMinor, "a"), change(ReleaseType::kPatch, "b")},
        .created_at = std::nullopt};
    EXPECT_EQ((*releases)[1], expected);
}

TEST(ReleaseStoreTest, ReadsLegacyDirectory)
{
    TempDir temp_dir("semverpp_release_legacy_dir");
    write_file(temp_dir.path() / ".changes" / "0.1.0.json",
               R"([{"type": "minor", "description": "Initial"}])");

    auto store = make_store(temp_dir.path());
    auto last = store.last_version();
    ASSERT_TRUE(last) << last.error().message;
    ASSERT_TRUE(last->has_value());
    EXPECT_EQ((*last)->to_string(), "0.1.0");
}

TEST(ReleaseStoreTest, AcceptsOffsetTimestamps)
{
    TempDir temp_dir("semverpp_release_offset");
    write_file(temp_dir.path() / ".semversioner" / "2.0.0.json",
               R"({"version": "2.0.0", "created_at": "2024-01-01T02:00:00.123456+02:00",)"
               R"( "changes": []})");

    auto releases = make_store(temp_dir.path()).list();
    ASSERT_TRUE(releases) << releases.error().message;
    ASSERT_EQ(releases->size(), 1U);
    ASSERT_TRUE(releases->front().created_at.has_value());
    EXPECT_EQ(common::format_iso8601(*releases->front().created_at), "2024-01-01T00:00:00Z");
}

TEST(ReleaseStoreTest, RejectsRecordNotNamedByVersion)
{
    TempDir temp_dir("semverpp_release_bad_name");
    write_file(temp_dir.path() / ".semversioner" / "notes.json", "[]");

    auto store = make_store(temp_dir.path());
    auto releases = store.list();
    ASSERT_FALSE(releases);
    EXPECT_EQ(releases.error().code, error_code::kInvalidVersion);
    EXPECT_NE(releases.error().message.find("notes.json"), std::string::npos);
}

TEST(ReleaseStoreTest, RejectsMalformedRecord)
{
    TempDir temp_dir("semverpp_release_malformed");
    write_file(temp_dir.path() / ".semversioner" / "1.0.0.json", R"({"changes": "nope"})");

    auto releases = make_store(temp_dir.path()).list();
    ASSERT_FALSE(releases);
    EXPECT_EQ(classify(releases.error()), ErrorKind::kIntegrityViolation);
}

}  // namespace semverpp::store::test
