#include <google/protobuf/empty.pb.h>
#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "acquisition/engine/v1.hpp"

using namespace acquisition::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  acquirectl <addr> submit <backend_id> <track_ref> <output_path>\n"
            << "  acquirectl <addr> status <job_id>\n"
            << "  acquirectl <addr> cancel <job_id>\n"
            << "  acquirectl <addr> list [backend_id]\n"
            << "  acquirectl <addr> store-credential <backend_id> <access_token> [refresh_token] [expires_in_s] [scope]\n"
            << "  acquirectl <addr> invalidate-credential <backend_id>\n"
            << "  acquirectl <addr> credential-status <backend_id>\n";
}

static std::string StateName(JobState state) {
  return JobState_Name(state);
}

static void PrintStatus(const JobStatus& s) {
  std::cout << "job_id=" << s.job_id() << " backend=" << s.backend_id() << " track=" << s.track_ref() << " state=" << StateName(s.state())
            << " attempt=" << s.attempt() << " bytes_written=" << s.bytes_written() << " poll_count=" << s.poll_count();
  if (s.has_last_error() && s.last_error().reason() != FAILURE_REASON_UNSPECIFIED) {
    std::cout << " reason=" << FailureReason_Name(s.last_error().reason()) << " message=\"" << s.last_error().message() << "\"";
  }
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel     = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto acquisition = AcquisitionService::NewStub(channel);
  auto credentials = CredentialService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  if (cmd == "submit") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    SubmitRequest req;
    req.set_backend_id(argv[3]);
    req.set_track_ref(argv[4]);
    req.set_output_path(argv[5]);

    SubmitResponse resp;
    auto           status = acquisition->Submit(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "job_id=" << resp.job_id() << " created=" << (resp.created() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "status") {
    if (argc < 4) return 1;

    GetStatusRequest req;
    req.set_job_id(argv[3]);

    GetStatusResponse resp;
    auto              status = acquisition->GetStatus(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintStatus(resp.status());
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelRequest req;
    req.set_job_id(argv[3]);

    CancelResponse resp;
    auto           status = acquisition->Cancel(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintStatus(resp.status());
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "list") {
    ListJobsRequest req;
    if (argc >= 4) req.set_backend_id(argv[3]);

    ListJobsResponse resp;
    auto             status = acquisition->ListJobs(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& job : resp.jobs()) PrintStatus(job);
    std::cout << "jobs=" << resp.jobs_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "store-credential") {
    if (argc < 5) return 1;

    StoreCredentialRequest req;
    req.set_backend_id(argv[3]);
    auto* credential = req.mutable_credential();
    credential->set_access_token(argv[4]);
    if (argc >= 6) credential->set_refresh_token(argv[5]);
    if (argc >= 7) {
      const std::int64_t expires_in = std::stoll(argv[6]);
      if (expires_in > 0) {
        *credential->mutable_expires_at() =
            google::protobuf::util::TimeUtil::GetCurrentTime() + google::protobuf::util::TimeUtil::SecondsToDuration(expires_in);
      }
    }
    if (argc >= 8) credential->set_scope(argv[7]);

    google::protobuf::Empty resp;
    auto                    status = credentials->StoreCredential(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "stored backend=" << req.backend_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "invalidate-credential") {
    if (argc < 4) return 1;

    InvalidateCredentialRequest req;
    req.set_backend_id(argv[3]);

    google::protobuf::Empty resp;
    auto                    status = credentials->InvalidateCredential(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "invalidated backend=" << req.backend_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "credential-status") {
    if (argc < 4) return 1;

    GetCredentialStatusRequest req;
    req.set_backend_id(argv[3]);

    GetCredentialStatusResponse resp;
    auto                        status = credentials->GetCredentialStatus(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    const auto& s = resp.summary();
    std::cout << "backend=" << s.backend_id() << " present=" << (s.present() ? "true" : "false") << " usable=" << (s.usable() ? "true" : "false")
              << " has_refresh_token=" << (s.has_refresh_token() ? "true" : "false") << " scope=" << s.scope()
              << " refresh_count=" << s.refresh_count();
    if (s.has_expires_at()) {
      std::cout << " expires_at=" << google::protobuf::util::TimeUtil::ToString(s.expires_at());
    }
    std::cout << "\n";
    return 0;
  }

  Usage();
  return 1;
}
