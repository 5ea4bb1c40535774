#pragma once

/**
 * @file version.hpp
 * @brief semverpp version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace semverpp {

/// semverpp version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the on-disk documents
constexpr const char* kChangesetSchema = "changeset.v1";
constexpr const char* kReleaseSchema = "release.v1";
constexpr const char* kReleaseLegacySchema = "release_legacy.v1";

/// Version reported when nothing has been released yet
constexpr const char* kInitialVersion = "0.0.0";

}  // namespace semverpp
