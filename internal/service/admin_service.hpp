#pragma once

#include <string_view>

#include "fetchbox/admin/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace fetchbox::service {

/*
  Operator surface: ingress enqueue, queue/DLQ inspection and replay.

  Errors are reported as util exceptions; the transport maps them.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  fetchbox::admin::v1::EnqueueResponse Enqueue(const fetchbox::admin::v1::EnqueueRequest& req);

  fetchbox::admin::v1::GetQueueEntryResponse GetQueueEntry(const fetchbox::admin::v1::GetQueueEntryRequest& req);

  fetchbox::admin::v1::ListDeadLettersResponse ListDeadLetters(const fetchbox::admin::v1::ListDeadLettersRequest& req);

  fetchbox::admin::v1::GetDeadLetterResponse GetDeadLetter(const fetchbox::admin::v1::GetDeadLetterRequest& req);

  fetchbox::admin::v1::ReplayDeadLetterResponse ReplayDeadLetter(const fetchbox::admin::v1::ReplayDeadLetterRequest& req);

  fetchbox::admin::v1::StatsResponse Stats(const fetchbox::admin::v1::StatsRequest& req);

  fetchbox::admin::v1::HealthResponse Health(const fetchbox::admin::v1::HealthRequest& req);

 private:
  template <typename Fn>
  auto Instrumented(std::string_view route, Fn&& fn) -> decltype(fn());

  ServiceContext ctx_;
};

} // namespace fetchbox::service
