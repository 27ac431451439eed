#pragma once

/**
 * @file version.hpp
 * @brief pkgaudit version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace pkgaudit {

/// pkgaudit version string
constexpr const char* kVersion = "0.3.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of emitted and consumed documents
constexpr const char* kReportSchemaVersion = "report.v1";
constexpr const char* kConfigSchemaVersion = "config.v1";

}  // namespace pkgaudit
