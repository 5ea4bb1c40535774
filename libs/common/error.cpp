/**
 * @file error.cpp
 * @brief Error classification
 */

#include "semverpp/common.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace semverpp {

namespace {

constexpr std::array<std::string_view, 7> kUserInputCodes = {
    error_code::kNoChangesPending,
    error_code::kMixedChanges,
    error_code::kInvalidVersion,
    error_code::kInvalidChangeType,
    error_code::kInvalidPrerelease,
    error_code::kTemplateError,
    error_code::kTemplateNotFound,
};

constexpr std::array<std::string_view, 2> kIntegrityCodes = {
    error_code::kParseError,
    error_code::kSchemaValidationFailed,
};

}  // namespace

ErrorKind classify(const Error& error) noexcept
{
    const std::string_view code = error.code;
    if (std::ranges::find(kUserInputCodes, code) != kUserInputCodes.end()) {
        return ErrorKind::kUserInput;
    }
    if (std::ranges::find(kIntegrityCodes, code) != kIntegrityCodes.end()) {
        return ErrorKind::kIntegrityViolation;
    }
    return ErrorKind::kFatalIo;
}

}  // namespace semverpp
