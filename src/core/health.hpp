#pragma once

#include <cstddef>
#include <string>

#include "rulekit.pb.h"

namespace provider_health {

inline rulekit::v1::ProviderHealth make_provider_health(std::size_t rule_count) {
  rulekit::v1::ProviderHealth h;
  if (rule_count == 0) {
    h.set_state(rulekit::v1::ProviderHealth::STATE_DEGRADED);
    h.set_message("no rules configured");
  } else {
    h.set_state(rulekit::v1::ProviderHealth::STATE_OK);
    h.set_message("ok");
  }
  (*h.mutable_metrics())["rule_count"] = std::to_string(rule_count);
  return h;
}

} // namespace provider_health
