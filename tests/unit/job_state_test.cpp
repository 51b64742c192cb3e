#include <cassert>
#include <iostream>

#include "internal/model/job.hpp"

namespace {

using acquisition::model::CanTransition;
using acquisition::model::FailureReason;
using acquisition::model::IsTerminal;
using acquisition::model::IsTransient;
using acquisition::model::JobState;
using acquisition::model::ToString;

void TestHappyPathTransitions() {
  assert(CanTransition(JobState::kQueued, JobState::kAuthorizing));
  assert(CanTransition(JobState::kAuthorizing, JobState::kAdmitted));
  assert(CanTransition(JobState::kAdmitted, JobState::kFetching));
  assert(CanTransition(JobState::kFetching, JobState::kDecrypting));
  assert(CanTransition(JobState::kFetching, JobState::kPollingTransfer));
  assert(CanTransition(JobState::kDecrypting, JobState::kCompleted));
  assert(CanTransition(JobState::kPollingTransfer, JobState::kCompleted));
}

void TestSkippingStepsIsRejected() {
  assert(!CanTransition(JobState::kQueued, JobState::kFetching));
  assert(!CanTransition(JobState::kQueued, JobState::kCompleted));
  assert(!CanTransition(JobState::kAuthorizing, JobState::kFetching));
  assert(!CanTransition(JobState::kFetching, JobState::kCompleted));
  assert(!CanTransition(JobState::kAdmitted, JobState::kCompleted));
}

void TestFailedReachableFromEveryActiveState() {
  for (auto from : {JobState::kQueued, JobState::kAuthorizing, JobState::kAdmitted, JobState::kFetching, JobState::kDecrypting,
                    JobState::kPollingTransfer}) {
    assert(CanTransition(from, JobState::kFailed));
    // re-authorization and retries go back through Authorizing
    assert(CanTransition(from, JobState::kAuthorizing));
  }
}

void TestTerminalStatesAreFinal() {
  for (auto from : {JobState::kCompleted, JobState::kFailed}) {
    assert(IsTerminal(from));
    assert(!CanTransition(from, from));
    assert(!CanTransition(from, JobState::kQueued));
    assert(!CanTransition(from, JobState::kAuthorizing));
    assert(!CanTransition(from, JobState::kFailed));
    assert(!CanTransition(from, JobState::kCompleted));
  }
  assert(!IsTerminal(JobState::kPollingTransfer));
  assert(!CanTransition(JobState::kDecrypting, JobState::kQueued));
}

void TestTransientReasons() {
  assert(IsTransient(FailureReason::kTransport));
  assert(IsTransient(FailureReason::kRateLimited));
  assert(IsTransient(FailureReason::kRemoteFailed));

  assert(!IsTransient(FailureReason::kAuth));
  assert(!IsTransient(FailureReason::kNotFound));
  assert(!IsTransient(FailureReason::kContractViolation));
  assert(!IsTransient(FailureReason::kCancelled));
  // queued-cap timeouts have their own retry budget
  assert(!IsTransient(FailureReason::kTimeout));
}

void TestNames() {
  assert(ToString(JobState::kPollingTransfer) == "polling_transfer");
  assert(ToString(JobState::kUnspecified) == "unspecified");
  assert(ToString(FailureReason::kContractViolation) == "contract_violation");
  assert(ToString(FailureReason::kNone) == "none");
}

} // namespace

int main() {
  TestHappyPathTransitions();
  TestSkippingStepsIsRejected();
  TestFailedReachableFromEveryActiveState();
  TestTerminalStatesAreFinal();
  TestTransientReasons();
  TestNames();

  std::cout << "acquisition_unit_job_state: pass\n";
  return 0;
}
