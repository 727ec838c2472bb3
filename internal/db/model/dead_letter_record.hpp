#pragma once

#include <cstdint>
#include <string>

#include "fetchbox/jobs/v1/task.pb.h"

namespace fetchbox::db::model {

struct DeadLetterRecord {
  uint64_t                 sequence = 0; // queue sequence of the failed entry
  fetchbox::jobs::v1::Task task;
  std::string              failure_code;
  std::string              failure_message;
  uint32_t                 attempts       = 0; // attempts of the failing phase
  uint32_t                 total_attempts = 0; // lease cycles across both phases
  uint64_t                 failed_at_ms   = 0;
};

struct ReplayRecord {
  uint64_t dead_letter_sequence = 0;
  uint64_t new_sequence         = 0;
  uint64_t replayed_at_ms       = 0;
};

}
