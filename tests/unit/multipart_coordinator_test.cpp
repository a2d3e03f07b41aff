#include "internal/core/multipart_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/util/errors.hpp"
#include "test_fakes.hpp"

namespace {

using ingest::core::CoordinatorPolicies;
using ingest::core::MultipartCoordinator;
using ingest::testing::FakeMultipartStore;
using ingest::testing::MakeBuffer;

CoordinatorPolicies Policies(uint32_t attempts) {
  CoordinatorPolicies policies;
  policies.initiate.max_attempts    = attempts;
  policies.part_upload.max_attempts = attempts;
  policies.complete.max_attempts    = attempts;
  policies.abort.max_attempts       = attempts;
  policies.object_io.max_attempts   = attempts;
  return policies;
}

void TestTransientPartFailureIsRetried() {
  auto                 store = std::make_shared<FakeMultipartStore>();
  MultipartCoordinator coordinator(store, Policies(3));

  const auto handle      = coordinator.Initiate("inputs/a");
  store->fail_upload_part = 2;
  const auto tag          = coordinator.UploadPart("inputs/a", handle, 1, MakeBuffer("abc"));
  assert(!tag.empty());
  assert(store->upload_part_calls == 3);
}

void TestInitiateUsesItsOwnPolicy() {
  auto                store    = std::make_shared<FakeMultipartStore>();
  CoordinatorPolicies policies = Policies(1);
  policies.initiate.max_attempts = 3;
  MultipartCoordinator coordinator(store, policies);

  store->flaky_initiate = 2;
  assert(!coordinator.Initiate("inputs/a").empty());
  assert(store->initiate_calls == 3);

  // Part uploads stay on their single attempt.
  const auto handle      = coordinator.Initiate("inputs/b");
  store->fail_upload_part = 1;
  bool threw              = false;
  try {
    coordinator.UploadPart("inputs/b", handle, 1, MakeBuffer("abc"));
  } catch (const ingest::util::StorageUploadFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestExhaustedRetriesReportStorageFailure() {
  auto                 store = std::make_shared<FakeMultipartStore>();
  MultipartCoordinator coordinator(store, Policies(2));

  const auto handle      = coordinator.Initiate("inputs/a");
  store->fail_upload_part = 5;
  bool threw              = false;
  try {
    coordinator.UploadPart("inputs/a", handle, 1, MakeBuffer("abc"));
  } catch (const ingest::util::StorageUploadFailure&) {
    threw = true;
  }
  assert(threw);
  assert(store->upload_part_calls == 2);
}

void TestStaleTagIsNotRetried() {
  auto                 store = std::make_shared<FakeMultipartStore>();
  MultipartCoordinator coordinator(store, Policies(4));

  const auto handle = coordinator.Initiate("inputs/a");
  const auto first  = coordinator.UploadPart("inputs/a", handle, 1, MakeBuffer("abc"));
  // Replacing the part invalidates the first tag.
  const auto second = coordinator.UploadPart("inputs/a", handle, 1, MakeBuffer("xyz"));
  assert(first != second);

  bool threw = false;
  try {
    coordinator.Complete("inputs/a", handle, {{1, first}});
  } catch (const ingest::util::StorageUploadFailure&) {
    threw = true;
  }
  assert(threw);
  assert(store->complete_calls == 1);

  const auto object = coordinator.Complete("inputs/a", handle, {{1, second}});
  assert(object.size == 3);
  assert(coordinator.Read("inputs/a")->ToString() == "xyz");
}

void TestCompleteConcatenatesInOrder() {
  auto                 store = std::make_shared<FakeMultipartStore>();
  MultipartCoordinator coordinator(store, Policies(1));

  const auto handle = coordinator.Initiate("inputs/b");
  const auto t2     = coordinator.UploadPart("inputs/b", handle, 2, MakeBuffer("world"));
  const auto t1     = coordinator.UploadPart("inputs/b", handle, 1, MakeBuffer("hello "));

  const auto object = coordinator.Complete("inputs/b", handle, {{1, t1}, {2, t2}});
  assert(object.key == "inputs/b");
  assert(object.size == 11);
  assert(store->Object("inputs/b") == "hello world");
}

void TestAbortAndRemoveAreIdempotent() {
  auto                 store = std::make_shared<FakeMultipartStore>();
  MultipartCoordinator coordinator(store, Policies(1));

  const auto handle = coordinator.Initiate("inputs/c");
  coordinator.Abort("inputs/c", handle);
  coordinator.Abort("inputs/c", handle);
  assert(!store->HasUpload(handle));

  coordinator.Write("layers/c.tif", MakeBuffer("bytes"));
  coordinator.Remove("layers/c.tif");
  coordinator.Remove("layers/c.tif");
  assert(!store->Exists("layers/c.tif"));
}

} // namespace

int main() {
  TestTransientPartFailureIsRetried();
  TestInitiateUsesItsOwnPolicy();
  TestExhaustedRetriesReportStorageFailure();
  TestStaleTagIsNotRetried();
  TestCompleteConcatenatesInOrder();
  TestAbortAndRemoveAreIdempotent();

  std::cout << "multipart_coordinator_test: pass\n";
  return 0;
}
