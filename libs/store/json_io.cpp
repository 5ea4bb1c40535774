/**
 * @file json_io.cpp
 * @brief JSON file helpers shared by the changeset and release stores
 */

#include "json_io.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

namespace semverpp::store {

namespace fs = std::filesystem;

semverpp::Error io_error(std::string_view what, const fs::path& path, const std::error_code& ec)
{
    if (ec) {
        return Error::make(std::string(error_code::kIoError),
                           std::format("{} {}: {}", what, path.string(), ec.message()));
    }
    return Error::make(std::string(error_code::kIoError), std::format("{} {}", what, path.string()));
}

bool is_hidden_entry(const fs::path& path)
{
    return path.filename().string().starts_with('.');
}

semverpp::Result<std::vector<fs::directory_entry>> list_directory(const fs::path& dir)
{
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return std::unexpected(io_error("Failed to list directory", dir, ec));
    }
    return entries;
}

semverpp::Result<nlohmann::json> read_json_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(io_error("Failed to open file for read:", path));
    }

    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(io_error("Failed to read file:", path));
    }

    try {
        return nlohmann::json::parse(content);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make(std::string(error_code::kParseError),
                        std::format("Failed to parse JSON from {}: {}", path.string(), ex.what())));
    }
}

std::string render_record(const nlohmann::json& payload)
{
    // nlohmann::json objects keep their keys sorted.
    return payload.dump(2) + "\n";
}

semverpp::VoidResult write_new_file(const fs::path& path, std::string_view content)
{
    std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::noreplace);
    if (!out.is_open()) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            return std::unexpected(Error::make(std::string(error_code::kFileExists),
                                               std::format("File already exists: {}",
                                                           path.string())));
        }
        return std::unexpected(io_error("Failed to open file for write:", path));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        std::error_code ec;
        fs::remove(path, ec);
        return std::unexpected(io_error("Failed to write file:", path));
    }
    return {};
}

semverpp::Result<fs::path> stage_file(const fs::path& dir, std::string_view content)
{
    std::random_device device;
    std::mt19937_64 engine(device());
    for (;;) {
        const fs::path staging = dir / std::format(".staging-{:016x}.tmp", engine());
        auto written = write_new_file(staging, content);
        if (written) {
            return staging;
        }
        if (written.error().code != error_code::kFileExists) {
            return std::unexpected(written.error());
        }
    }
}

semverpp::VoidResult ensure_directory(const fs::path& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to create directory", dir, ec));
    }
    return {};
}

}  // namespace semverpp::store
