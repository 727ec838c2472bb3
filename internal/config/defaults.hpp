#pragma once

#include "config/config.pb.h"

namespace fetchbox::config {

/*
  Fills every unset (zero) field with its documented default so that the
  rest of the runtime reads the proto directly without fallbacks.
*/
void ApplyDefaults(fetchbox::runtime::config::RuntimeConfig& config);

fetchbox::runtime::config::RuntimeConfig DefaultConfig();

} // namespace fetchbox::config
