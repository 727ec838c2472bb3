#include "admin_server.hpp"

#include <chrono>

#include "grpc_error.hpp"
#include "internal/observability/spans.hpp"

namespace fetchbox::grpc {

using namespace fetchbox::admin::v1;

namespace {

template <typename Fn>
::grpc::Status Invoke(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);
  const auto               started = std::chrono::steady_clock::now();

  ::grpc::Status status = ::grpc::Status::OK;
  try {
    fn();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    status = ToStatus(e);
  }

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
  auto&                                           metrics = observability::Metrics::Instance();
  metrics.RecordRequest(route, status.ok());
  metrics.ObserveRequestLatencyMs(route, elapsed.count());
  return status;
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<fetchbox::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Enqueue(::grpc::ServerContext*, const EnqueueRequest* req, EnqueueResponse* resp) {
  return Invoke("admin.Enqueue", [&] { *resp = service_->Enqueue(*req); });
}

::grpc::Status AdminServer::GetQueueEntry(::grpc::ServerContext*, const GetQueueEntryRequest* req, GetQueueEntryResponse* resp) {
  return Invoke("admin.GetQueueEntry", [&] { *resp = service_->GetQueueEntry(*req); });
}

::grpc::Status AdminServer::ListDeadLetters(::grpc::ServerContext*, const ListDeadLettersRequest* req, ListDeadLettersResponse* resp) {
  return Invoke("admin.ListDeadLetters", [&] { *resp = service_->ListDeadLetters(*req); });
}

::grpc::Status AdminServer::GetDeadLetter(::grpc::ServerContext*, const GetDeadLetterRequest* req, GetDeadLetterResponse* resp) {
  return Invoke("admin.GetDeadLetter", [&] { *resp = service_->GetDeadLetter(*req); });
}

::grpc::Status AdminServer::ReplayDeadLetter(::grpc::ServerContext*, const ReplayDeadLetterRequest* req, ReplayDeadLetterResponse* resp) {
  return Invoke("admin.ReplayDeadLetter", [&] { *resp = service_->ReplayDeadLetter(*req); });
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Invoke("admin.Stats", [&] { *resp = service_->Stats(*req); });
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  return Invoke("admin.Health", [&] { *resp = service_->Health(*req); });
}

} // namespace fetchbox::grpc
