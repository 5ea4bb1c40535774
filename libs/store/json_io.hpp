#pragma once

/**
 * @file json_io.hpp
 * @brief JSON file helpers shared by the changeset and release stores
 */

#include "semverpp/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace semverpp::store {

/**
 * Read and parse a JSON file
 * @return Parsed document, IOError if unreadable, ParseError if malformed
 */
[[nodiscard]] semverpp::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Render a stored record: 2-space indent, sorted keys, trailing newline
 */
[[nodiscard]] std::string render_record(const nlohmann::json& payload);

/**
 * Create a new file and write content
 *
 * FileExists when the name is taken; nothing is written then. Any other
 * failure is an IOError, and a partially written file is removed.
 */
[[nodiscard]] semverpp::VoidResult write_new_file(const std::filesystem::path& path,
                                                  std::string_view content);

/**
 * Write content to a fresh hidden staging file in dir
 *
 * Only a clash on the random staging name is retried.
 * @return Path of the complete staging file
 */
[[nodiscard]] semverpp::Result<std::filesystem::path> stage_file(const std::filesystem::path& dir,
                                                                 std::string_view content);

/**
 * Create a directory (and parents) if missing
 */
[[nodiscard]] semverpp::VoidResult ensure_directory(const std::filesystem::path& dir);

[[nodiscard]] semverpp::Error io_error(std::string_view what,
                                       const std::filesystem::path& path,
                                       const std::error_code& ec = {});

/**
 * List the entries of a directory without following into subdirectories
 * @return Entries in unspecified order, or IOError
 */
[[nodiscard]] semverpp::Result<std::vector<std::filesystem::directory_entry>>
list_directory(const std::filesystem::path& dir);

/// Entries such as staging files are hidden from scans.
[[nodiscard]] bool is_hidden_entry(const std::filesystem::path& path);

}  // namespace semverpp::store
