#pragma once

#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "client/CallExecutor.hpp"
#include "common/Errors.hpp"
#include "common/Types.hpp"
#include "transport/IHttpTransport.hpp"

namespace wapi::client {

/// Drives WAPI cursor paging (_paging / _max_results / _page_id) until the
/// server stops returning next_page_id, accumulating results in server order.
///
/// The server's pagination contract is trusted: a cursor that points back at
/// an already-seen page is followed, not detected.
/// Class abbreviation: pg
class Paginator {
 public:
  Paginator(const CallExecutor& ceExecutor, std::shared_ptr<spdlog::logger> spLog)
      : _ceExecutor(ceExecutor), _spLog(std::move(spLog)) {}

  /// Issue hreq with paging enabled and return the concatenation of all pages.
  /// Throws ValidationError if iPageSize <= 0.
  template <typename T>
  std::vector<T> fetchAll(transport::HttpRequest hreq, int iPageSize) const {
    if (iPageSize <= 0) {
      throw common::ValidationError("invalid_page_size",
                                    "Page size must be > 0 (got " + std::to_string(iPageSize) +
                                        ")");
    }

    hreq.vQuery.emplace_back("_paging", "1");
    hreq.vQuery.emplace_back("_max_results", std::to_string(iPageSize));

    auto res = _ceExecutor.execute<common::Result<std::vector<T>>>(hreq);
    std::vector<T> vAll = std::move(res.result);
    auto oNextPageId = std::move(res.oNextPageId);

    // Continuation requests carry the cursor as one extra parameter.
    hreq.vQuery.emplace_back("_page_id", "");
    while (oNextPageId) {
      _spLog->info("Querying next page id: {}", *oNextPageId);
      hreq.vQuery.back().second = *oNextPageId;
      res = _ceExecutor.execute<common::Result<std::vector<T>>>(hreq);
      vAll.insert(vAll.end(), std::make_move_iterator(res.result.begin()),
                  std::make_move_iterator(res.result.end()));
      oNextPageId = std::move(res.oNextPageId);
    }
    return vAll;
  }

 private:
  const CallExecutor& _ceExecutor;
  std::shared_ptr<spdlog::logger> _spLog;
};

}  // namespace wapi::client
