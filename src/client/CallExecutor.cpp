#include "client/CallExecutor.hpp"

#include "model/Records.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace wapi::client {

CallExecutor::CallExecutor(const transport::IHttpTransport& htTransport)
    : _htTransport(htTransport) {}

bool CallExecutor::isJsonContentType(const std::string& sContentType) {
  std::string sMediaType = sContentType.substr(0, sContentType.find(';'));
  while (!sMediaType.empty() && std::isspace(static_cast<unsigned char>(sMediaType.back()))) {
    sMediaType.pop_back();
  }
  std::transform(sMediaType.begin(), sMediaType.end(), sMediaType.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sMediaType == "application/json";
}

void CallExecutor::raiseFailure(const transport::HttpResponse& hres) {
  if (isJsonContentType(hres.sContentType)) {
    const auto jBody = nlohmann::json::parse(hres.sBody, nullptr, /*allow_exceptions=*/false);
    if (jBody.is_object() && jBody.contains("Error")) {
      model::WapiError we;
      try {
        we = jBody.get<model::WapiError>();
      } catch (const nlohmann::json::exception&) {
        we.sError = jBody.dump();
      }
      throw common::ApiError(hres.iStatus, we.sCode, we.sError, we.sText);
    }
  }

  std::string sMsg = "Request failed, " + std::to_string(hres.iStatus);
  if (!hres.sStatusMessage.empty()) {
    sMsg += " " + hres.sStatusMessage;
  }
  throw common::TransportError(hres.iStatus, "http_error", sMsg);
}

common::TransportError CallExecutor::malformed(const transport::HttpRequest& hreq, int iStatus,
                                               const std::string& sDetail) {
  return common::TransportError(iStatus, "malformed_response",
                                "Unexpected response for " + hreq.sMethod + " " + hreq.sPath +
                                    ": " + sDetail);
}

nlohmann::json CallExecutor::execute(const transport::HttpRequest& hreq) const {
  return send(hreq).jBody;
}

CallExecutor::ParsedResponse CallExecutor::send(const transport::HttpRequest& hreq) const {
  const transport::HttpResponse hres = _htTransport.send(hreq);

  if (hres.iStatus < 200 || hres.iStatus >= 300) {
    raiseFailure(hres);
  }

  auto jBody = nlohmann::json::parse(hres.sBody, nullptr, /*allow_exceptions=*/false);
  if (jBody.is_discarded()) {
    throw common::TransportError(hres.iStatus, "malformed_response",
                                 "Response to " + hreq.sMethod + " " + hreq.sPath +
                                     " is not valid JSON");
  }
  return {hres.iStatus, std::move(jBody)};
}

}  // namespace wapi::client
