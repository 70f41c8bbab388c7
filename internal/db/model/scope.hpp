#pragma once

#include <string>

namespace autopilot::db::model {

/*
  Hierarchy coordinates of a row. Queries match on the narrowest
  non-empty id; an all-empty scope matches everything.
*/
struct Scope {
  std::string campaign_id;
  std::string adset_id;
  std::string ad_id;

  bool Empty() const {
    return campaign_id.empty() && adset_id.empty() && ad_id.empty();
  }

  // True when `row` lies inside this scope.
  bool Contains(const Scope& row) const {
    if (!ad_id.empty()) return row.ad_id == ad_id;
    if (!adset_id.empty()) return row.adset_id == adset_id;
    if (!campaign_id.empty()) return row.campaign_id == campaign_id;
    return true;
  }

  bool operator==(const Scope&) const = default;
};

} // namespace autopilot::db::model
