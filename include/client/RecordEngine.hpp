#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "client/CallExecutor.hpp"
#include "common/Errors.hpp"
#include "common/Types.hpp"
#include "model/Records.hpp"
#include "transport/IHttpTransport.hpp"

namespace wapi::client {

/// Generic search / create / modify / delete over any record kind described
/// by model::RecordTraits<T>. Batch mutations run sequentially in the order
/// the search returned the matches, stop at the first failure and do not
/// roll back records already changed.
/// Class abbreviation: re
class RecordEngine {
 public:
  RecordEngine(const CallExecutor& ceExecutor, std::string sWapiVersion, uint32_t uDefaultTtl,
               std::shared_ptr<spdlog::logger> spLog);

  /// {"ttl": <default ttl>, "use_ttl": true}. The appliance ignores ttl
  /// unless use_ttl is set.
  nlohmann::json newTtlRequest() const;

  /// GET <version>/<objtype>?<filter>
  template <typename T>
  std::vector<T> search(const common::QueryFilter& qfFilter) const {
    auto hreq = objectRequest("GET", model::RecordTraits<T>::kObjectType);
    hreq.vQuery.assign(qfFilter.begin(), qfFilter.end());
    return _ceExecutor.execute<common::Result<std::vector<T>>>(hreq).result;
  }

  /// POST <version>/<objtype> with jBody.
  template <typename T>
  T create(const nlohmann::json& jBody) const {
    auto hreq = objectRequest("POST", model::RecordTraits<T>::kObjectType);
    hreq.sBody = jBody.dump();
    return _ceExecutor.execute<common::Result<T>>(hreq).result;
  }

  /// PUT <version>/<ref> with jChanges; returns the updated object as T.
  template <typename T>
  T modify(const std::string& sRef, const nlohmann::json& jChanges) const {
    auto hreq = refRequest("PUT", sRef);
    hreq.sBody = jChanges.dump();
    return _ceExecutor.execute<common::Result<T>>(hreq).result;
  }

  /// Apply jChanges to every match. Fail-fast, no rollback.
  template <typename T>
  std::vector<T> modifyEach(const std::vector<T>& vMatches, const nlohmann::json& jChanges) const {
    std::vector<T> vModified;
    vModified.reserve(vMatches.size());
    for (const auto& rec : vMatches) {
      _spLog->warn("Modifying {} record {} to {}", model::RecordTraits<T>::kLabel,
                   nlohmann::json(rec).dump(), jChanges.dump());
      try {
        vModified.push_back(modify<T>(rec.sRef, jChanges));
      } catch (const common::AppError& ex) {
        _spLog->error("Error modifying {} record {}: {}", model::RecordTraits<T>::kLabel,
                      rec.sRef, ex.what());
        throw;
      }
    }
    return vModified;
  }

  /// DELETE <version>/<ref>; returns the deleted reference.
  std::string deleteRef(const std::string& sRef) const;

  /// Delete every match and return the deleted references. Fail-fast, no rollback.
  template <typename T>
  std::vector<std::string> deleteEach(const std::vector<T>& vMatches) const {
    std::vector<std::string> vDeleted;
    vDeleted.reserve(vMatches.size());
    for (const auto& rec : vMatches) {
      _spLog->warn("Deleting a {} record: {}", model::RecordTraits<T>::kLabel,
                   nlohmann::json(rec).dump());
      vDeleted.push_back(deleteRef(rec.sRef));
    }
    return vDeleted;
  }

  /// Request for <version>/<objtype>.
  transport::HttpRequest objectRequest(const std::string& sMethod,
                                       const std::string& sObjectType) const;

  /// Request for <version>/<ref>.
  transport::HttpRequest refRequest(const std::string& sMethod, const std::string& sRef) const;

 private:
  const CallExecutor& _ceExecutor;
  std::string _sWapiVersion;
  uint32_t _uDefaultTtl;
  std::shared_ptr<spdlog::logger> _spLog;
};

}  // namespace wapi::client
