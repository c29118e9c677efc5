#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace wapi::cli {

constexpr int kExitUsage = 2;

/// Run one wapi-cli command. vArgs excludes the program name.
///
/// Configuration comes from WAPI_* environment variables; results are
/// written to osOut as JSON, diagnostics to osErr, and log lines to stderr so
/// that osOut stays parseable. Returns 0 on success, 1 on failure and
/// kExitUsage on a usage error.
int run(const std::vector<std::string>& vArgs, std::ostream& osOut, std::ostream& osErr);

}  // namespace wapi::cli
