#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace wapi::common {

/// Search modifier suffix appended to a WAPI filter field name.
/// The token set is fixed by the appliance.
enum class SearchModifier { None, CaseInsensitive, Regex, Negate, LessOrEqual, GreaterOrEqual };

/// Returns the WAPI token for a modifier ("", ":", "~", "!", "<", ">").
inline const char* searchModifierToken(SearchModifier smModifier) {
  switch (smModifier) {
    case SearchModifier::None:
      return "";
    case SearchModifier::CaseInsensitive:
      return ":";
    case SearchModifier::Regex:
      return "~";
    case SearchModifier::Negate:
      return "!";
    case SearchModifier::LessOrEqual:
      return "<";
    case SearchModifier::GreaterOrEqual:
      return ">";
  }
  return "";
}

/// Field name with its search modifier suffix, e.g. ("name", CaseInsensitive) -> "name:".
inline std::string withModifier(const std::string& sField, SearchModifier smModifier) {
  return sField + searchModifierToken(smModifier);
}

/// WAPI filter criteria, ANDed by the server. Ordered so the outgoing query is stable.
using QueryFilter = std::map<std::string, std::string>;

/// Envelope of a successful response with _return_as_object=1.
/// Class abbreviation: res
template <typename T>
struct Result {
  T result{};
  std::optional<std::string> oNextPageId;
};

template <typename T>
void from_json(const nlohmann::json& j, Result<T>& res) {
  j.at("result").get_to(res.result);
  auto it = j.find("next_page_id");
  if (it != j.end() && it->is_string()) {
    res.oNextPageId = it->template get<std::string>();
  } else {
    res.oNextPageId.reset();
  }
}

}  // namespace wapi::common
