#include "internal/retry/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using linksync::model::ErrorKind;
using linksync::retry::RetryPolicy;
using std::chrono::milliseconds;

void TestOnlyTransientKindsAreRetried() {
  RetryPolicy policy{3, milliseconds(100), milliseconds(0)};

  assert(policy.ShouldRetry(ErrorKind::kTransientIO, 1));
  assert(policy.ShouldRetry(ErrorKind::kLocked, 1));
  assert(!policy.ShouldRetry(ErrorKind::kSyncConflict, 1));
  assert(!policy.ShouldRetry(ErrorKind::kAccessDenied, 1));
  assert(!policy.ShouldRetry(ErrorKind::kGatewayUnavailable, 1));
}

void TestRetriesCountExtraAttempts() {
  RetryPolicy policy{2, milliseconds(10), milliseconds(0)};

  assert(policy.ShouldRetry(ErrorKind::kTransientIO, 1));
  assert(policy.ShouldRetry(ErrorKind::kTransientIO, 2));
  assert(!policy.ShouldRetry(ErrorKind::kTransientIO, 3));

  RetryPolicy none{0, milliseconds(10), milliseconds(0)};
  assert(!none.ShouldRetry(ErrorKind::kLocked, 1));
}

void TestExponentialBackoffSchedule() {
  RetryPolicy policy{5, milliseconds(500), milliseconds(0)};

  assert(policy.BackoffFor(1) == milliseconds(500));
  assert(policy.BackoffFor(2) == milliseconds(1000));
  assert(policy.BackoffFor(3) == milliseconds(2000));
  assert(policy.BackoffFor(4) == milliseconds(4000));
}

void TestBackoffIsCapped() {
  RetryPolicy policy{10, milliseconds(500), milliseconds(1500)};

  assert(policy.BackoffFor(1) == milliseconds(500));
  assert(policy.BackoffFor(2) == milliseconds(1000));
  assert(policy.BackoffFor(3) == milliseconds(1500));
  assert(policy.BackoffFor(40) == milliseconds(1500));
}

void TestZeroBaseMeansNoWait() {
  RetryPolicy policy{3, milliseconds(0), milliseconds(0)};
  assert(policy.BackoffFor(1) == milliseconds(0));
  assert(policy.BackoffFor(3) == milliseconds(0));
}

} // namespace

int main() {
  TestOnlyTransientKindsAreRetried();
  TestRetriesCountExtraAttempts();
  TestExponentialBackoffSchedule();
  TestBackoffIsCapped();
  TestZeroBaseMeansNoWait();

  std::cout << "linksync_unit_retry_policy: pass\n";
  return 0;
}
