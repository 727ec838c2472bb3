#pragma once

#include <cstdint>
#include <string>

#include "fetchbox/jobs/v1/task.pb.h"

namespace fetchbox::db::model {

// Retry budget a failed lease cycle is charged to.
enum class AttemptPhase {
  kDownload,
  kUpload,
};

struct QueueEntryRecord {
  uint64_t                      sequence = 0;
  fetchbox::jobs::v1::Task      task;
  uint32_t                      attempt_count = 0;
  // cycles that failed after the download succeeded; the rest of
  // attempt_count failed in the download phase
  uint32_t                      upload_attempts = 0;
  fetchbox::jobs::v1::QueueStatus status      = fetchbox::jobs::v1::QUEUE_STATUS_PENDING;
  std::string                   lease_owner;
  uint64_t                      lease_expires_at_ms = 0;
  uint64_t                      visible_after_ms    = 0;
  uint64_t                      updated_at_ms       = 0;

  // persisted task blob failed to decode; task is empty
  bool corrupt = false;

  // 1-based attempt number within `phase` of the cycle now running.
  uint32_t NextAttempt(AttemptPhase phase) const {
    return phase == AttemptPhase::kUpload ? upload_attempts + 1 : attempt_count - upload_attempts + 1;
  }
};

struct QueueCounts {
  uint64_t pending       = 0;
  uint64_t leased        = 0;
  uint64_t completed     = 0;
  uint64_t dead_lettered = 0;
  uint64_t next_sequence = 0;
};

}
