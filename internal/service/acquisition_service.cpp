#include "acquisition_service.hpp"

#include <stdexcept>

#include "internal/orchestrator/job_orchestrator.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_output_sink.hpp"
#include "internal/util/errors.hpp"
#include "proto_mapping.hpp"
#include "rpc_observer.hpp"

namespace acquisition::service {

using namespace acquisition::engine::v1;

AcquisitionService::AcquisitionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.orchestrator) {
    throw std::invalid_argument("AcquisitionService requires an orchestrator");
  }
}

SubmitResponse AcquisitionService::Submit(const SubmitRequest& req) {
  return ObserveRpc("AcquisitionService/Submit", req.backend_id(), [&] {
    if (req.backend_id().empty()) {
      throw std::invalid_argument("backend_id is required");
    }
    if (req.track_ref().empty()) {
      throw std::invalid_argument("track_ref is required");
    }
    if (!ctx_.orchestrator->HasBackend(req.backend_id())) {
      throw util::NotFound("unknown backend: " + req.backend_id());
    }

    const auto path = storage::common::ResolveOutputPath(ctx_.output_root, req.output_path());
    auto       sink = std::make_shared<storage::DiskOutputSink>(path, ctx_.fsync);

    auto result = ctx_.orchestrator->Submit(req.backend_id(), req.track_ref(), std::move(sink));

    SubmitResponse resp;
    resp.set_job_id(result.job_id);
    resp.set_created(result.created);
    return resp;
  });
}

GetStatusResponse AcquisitionService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("AcquisitionService/GetStatus", req.job_id(), [&] {
    if (req.job_id().empty()) {
      throw std::invalid_argument("job_id is required");
    }

    GetStatusResponse resp;
    *resp.mutable_status() = ToProto(ctx_.orchestrator->Status(req.job_id()));
    return resp;
  });
}

CancelResponse AcquisitionService::Cancel(const CancelRequest& req) {
  return ObserveRpc("AcquisitionService/Cancel", req.job_id(), [&] {
    if (req.job_id().empty()) {
      throw std::invalid_argument("job_id is required");
    }

    CancelResponse resp;
    *resp.mutable_status() = ToProto(ctx_.orchestrator->Cancel(req.job_id()));
    return resp;
  });
}

ListJobsResponse AcquisitionService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("AcquisitionService/ListJobs", req.backend_id(), [&] {
    ListJobsResponse resp;
    for (const auto& status : ctx_.orchestrator->List(req.backend_id())) {
      *resp.add_jobs() = ToProto(status);
    }
    return resp;
  });
}

} // namespace acquisition::service
