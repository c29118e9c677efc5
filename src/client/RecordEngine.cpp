#include "client/RecordEngine.hpp"

#include "common/IpAddrs.hpp"

namespace wapi::client {

RecordEngine::RecordEngine(const CallExecutor& ceExecutor, std::string sWapiVersion,
                           uint32_t uDefaultTtl, std::shared_ptr<spdlog::logger> spLog)
    : _ceExecutor(ceExecutor),
      _sWapiVersion(std::move(sWapiVersion)),
      _uDefaultTtl(uDefaultTtl),
      _spLog(std::move(spLog)) {}

nlohmann::json RecordEngine::newTtlRequest() const {
  return nlohmann::json{{"ttl", _uDefaultTtl}, {"use_ttl", true}};
}

std::string RecordEngine::deleteRef(const std::string& sRef) const {
  common::ipaddrs::requireNonEmpty(sRef, "Reference");
  try {
    return _ceExecutor.execute<common::Result<std::string>>(refRequest("DELETE", sRef)).result;
  } catch (const common::AppError& ex) {
    _spLog->error("Error deleting record {}: {}", sRef, ex.what());
    throw;
  }
}

transport::HttpRequest RecordEngine::objectRequest(const std::string& sMethod,
                                                   const std::string& sObjectType) const {
  transport::HttpRequest hreq;
  hreq.sMethod = sMethod;
  hreq.sPath = _sWapiVersion + "/" + sObjectType;
  return hreq;
}

transport::HttpRequest RecordEngine::refRequest(const std::string& sMethod,
                                                const std::string& sRef) const {
  transport::HttpRequest hreq;
  hreq.sMethod = sMethod;
  hreq.sPath = _sWapiVersion + "/" + sRef;
  return hreq;
}

}  // namespace wapi::client
