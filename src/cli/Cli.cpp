#include "cli/Cli.hpp"

#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "client/WapiClient.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

// wapi-cli: read-only queries against an Infoblox appliance.

namespace wapi::cli {

namespace {

void printUsage(std::ostream& os) {
  os << "usage: wapi-cli <command> [args]\n"
     << "\n"
     << "commands:\n"
     << "  auth-zones                 list authoritative zones\n"
     << "  delegated-zones <pageSize> list delegated zones, paging through all results\n"
     << "  a <name>                   A records by name\n"
     << "  a-by-ip <ipv4>             A records by address\n"
     << "  aaaa <name>                AAAA records by name\n"
     << "  cname <alias>              CNAME records by alias\n"
     << "  mx <name>                  MX records by name\n"
     << "  ptr <ip>                   PTR records by IPv4 or IPv6 address\n"
     << "  txt <name>                 TXT records by name\n"
     << "  host <name>                host records by name\n"
     << "\n"
     << "environment:\n"
     << "  WAPI_ENDPOINT, WAPI_USERNAME, WAPI_PASSWORD[_FILE]    required\n"
     << "  WAPI_TRUST_STORE, WAPI_TRUST_STORE_PASSWORD[_FILE]    required unless WAPI_TLS_VERIFY=false\n"
     << "  WAPI_VERSION, WAPI_DNS_VIEW, WAPI_TTL, WAPI_RESOURCE_DIR,\n"
     << "  WAPI_TIMEOUT_SECONDS, WAPI_DEBUG, WAPI_LOG_LEVEL      optional\n";
}

/// Parse a page size argument; empty when it is not a decimal integer.
/// Range checks are left to WapiClient.
std::optional<int> parsePageSize(const std::string& sArg) {
  size_t nPos = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sArg, &nPos);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (nPos != sArg.size()) {
    return std::nullopt;
  }
  return iValue;
}

nlohmann::json runCommand(const client::WapiClient& wcClient, const std::string& sCommand,
                          const std::vector<std::string>& vArgs) {
  if (sCommand == "auth-zones") {
    return wcClient.getAuthZones();
  }
  if (sCommand == "delegated-zones") {
    return wcClient.getDelegatedZones(parsePageSize(vArgs.at(0)).value());
  }
  if (sCommand == "a") {
    return wcClient.getARec(vArgs.at(0));
  }
  if (sCommand == "a-by-ip") {
    return wcClient.getARecByIp(vArgs.at(0));
  }
  if (sCommand == "aaaa") {
    return wcClient.getAaaaRec(vArgs.at(0));
  }
  if (sCommand == "cname") {
    return wcClient.getCNameRec(vArgs.at(0));
  }
  if (sCommand == "mx") {
    return wcClient.getMxRec(vArgs.at(0));
  }
  if (sCommand == "ptr") {
    return wcClient.getPtrRec(vArgs.at(0));
  }
  if (sCommand == "txt") {
    return wcClient.getTxtRec(vArgs.at(0));
  }
  return wcClient.getHostRec(vArgs.at(0));
}

/// Number of arguments a command takes, or -1 if the command is unknown.
int arityOf(const std::string& sCommand) {
  if (sCommand == "auth-zones") {
    return 0;
  }
  static const std::vector<std::string> vUnary = {"delegated-zones", "a",   "a-by-ip",
                                                  "aaaa",            "cname", "mx",
                                                  "ptr",             "txt", "host"};
  for (const auto& sName : vUnary) {
    if (sName == sCommand) {
      return 1;
    }
  }
  return -1;
}

}  // namespace

int run(const std::vector<std::string>& vArgs, std::ostream& osOut, std::ostream& osErr) {
  if (vArgs.empty()) {
    printUsage(osErr);
    return kExitUsage;
  }
  const std::string& sCommand = vArgs.front();
  if (sCommand == "-h" || sCommand == "--help") {
    printUsage(osOut);
    return EXIT_SUCCESS;
  }
  const std::vector<std::string> vCmdArgs(vArgs.begin() + 1, vArgs.end());
  if (arityOf(sCommand) < 0 || static_cast<int>(vCmdArgs.size()) != arityOf(sCommand)) {
    osErr << "wapi-cli: invalid command or arguments: " << sCommand << "\n";
    printUsage(osErr);
    return kExitUsage;
  }
  if (sCommand == "delegated-zones" && !parsePageSize(vCmdArgs.front())) {
    osErr << "wapi-cli: page size is not a number: " << vCmdArgs.front() << "\n";
    printUsage(osErr);
    return kExitUsage;
  }

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfg = common::Config::load();

    common::Logger::init(cfg.logLevel(), common::LogTarget::Stderr);
    auto spLog = common::Logger::get();

    // ── Step 2: Build the client (trust store, TLS context) ──────────────
    client::WapiClient wcClient(std::move(cfg), spLog);

    // ── Step 3: Run the query ────────────────────────────────────────────
    const nlohmann::json jResult = runCommand(wcClient, sCommand, vCmdArgs);
    osOut << jResult.dump(2) << "\n";
    spLog->debug("{} returned {} entries", sCommand, jResult.size());
    return EXIT_SUCCESS;
  } catch (const common::ApiError& ex) {
    osErr << "[error] " << ex._sErrorCode << ": " << ex.what();
    if (!ex._sText.empty()) {
      osErr << " (" << ex._sText << ")";
    }
    osErr << "\n";
    return EXIT_FAILURE;
  } catch (const common::AppError& ex) {
    osErr << "[error] " << ex._sErrorCode << ": " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    osErr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}

}  // namespace wapi::cli
