#pragma once

/**
 * @file version.hpp
 * @brief kcfgvex version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace kcfgvex {

/// kcfgvex version string
constexpr const char* kVersion = "0.3.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// CycloneDX specification version emitted by default
constexpr const char* kDefaultCycloneDxSpecVersion = "1.4";

/// Name written to vulnerability.source.name
constexpr const char* kVulnerabilitySourceName = "NVD";

/// Prefix of vulnerability.source.url (CVE id appended)
constexpr const char* kVulnerabilitySourceUrlPrefix = "https://nvd.nist.gov/vuln/detail/";

}  // namespace kcfgvex
