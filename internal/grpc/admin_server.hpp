#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fetchbox/admin/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace fetchbox::grpc {

class AdminServer final : public fetchbox::admin::v1::FetchboxAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<fetchbox::service::AdminService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*, const fetchbox::admin::v1::EnqueueRequest*, fetchbox::admin::v1::EnqueueResponse*) override;

  ::grpc::Status GetQueueEntry(::grpc::ServerContext*, const fetchbox::admin::v1::GetQueueEntryRequest*,
                               fetchbox::admin::v1::GetQueueEntryResponse*) override;

  ::grpc::Status ListDeadLetters(::grpc::ServerContext*, const fetchbox::admin::v1::ListDeadLettersRequest*,
                                 fetchbox::admin::v1::ListDeadLettersResponse*) override;

  ::grpc::Status GetDeadLetter(::grpc::ServerContext*, const fetchbox::admin::v1::GetDeadLetterRequest*,
                               fetchbox::admin::v1::GetDeadLetterResponse*) override;

  ::grpc::Status ReplayDeadLetter(::grpc::ServerContext*, const fetchbox::admin::v1::ReplayDeadLetterRequest*,
                                  fetchbox::admin::v1::ReplayDeadLetterResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const fetchbox::admin::v1::StatsRequest*, fetchbox::admin::v1::StatsResponse*) override;

  ::grpc::Status Health(::grpc::ServerContext*, const fetchbox::admin::v1::HealthRequest*, fetchbox::admin::v1::HealthResponse*) override;

 private:
  std::shared_ptr<fetchbox::service::AdminService> service_;
};

} // namespace fetchbox::grpc
