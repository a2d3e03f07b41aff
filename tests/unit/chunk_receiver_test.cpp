#include "internal/core/chunk_receiver.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/catalog_registrar.hpp"
#include "internal/core/duplicate_resolver.hpp"
#include "internal/core/multipart_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/metadata/filename_parser.hpp"
#include "internal/util/errors.hpp"
#include "test_fakes.hpp"

namespace {

using namespace ingest;
using ingest::testing::FakeMultipartStore;
using ingest::testing::FakeRasterConverter;
using ingest::testing::MakeBuffer;

constexpr const char* kName      = "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_2010.tif";
constexpr const char* kLayerName = "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_2010";

struct Harness {
  explicit Harness(bool default_overwrite = false) {
    repository  = std::make_shared<db::memory::MemoryRepository>();
    store       = std::make_shared<FakeMultipartStore>();
    coordinator = std::make_shared<core::MultipartCoordinator>(store, core::CoordinatorPolicies{});
    converter   = std::make_shared<FakeRasterConverter>();
    auto parser = std::make_shared<metadata::FilenameParser>(metadata::Vocabulary::Defaults());
    auto resolver  = std::make_shared<core::DuplicateResolver>(repository, coordinator, default_overwrite);
    auto registrar = std::make_shared<catalog::CatalogRegistrar>(repository, util::RetryPolicy{});
    receiver = std::make_shared<core::ChunkReceiver>(repository, coordinator, parser, resolver, converter, registrar, core::ReceiverOptions{});
  }

  std::string Create(uint64_t total, const std::string& name = kName, std::optional<bool> overwrite = std::nullopt) {
    core::CreateRequest request;
    request.total_length = total;
    request.content_type = "image/tiff";
    request.owner        = "tester";
    request.name         = name;
    request.overwrite    = overwrite;
    return receiver->Create(request).session_id();
  }

  core::ChunkOutcome Send(const std::string& session_id, uint64_t offset, const std::string& bytes, uint64_t total,
                          const std::string& name = kName) {
    core::ChunkRequest request;
    request.session_id     = session_id;
    request.offset         = offset;
    request.total_length   = total;
    request.content_length = bytes.size();
    request.name           = name;
    request.data           = MakeBuffer(bytes);
    return receiver->Chunk(request);
  }

  std::optional<db::model::CatalogEntryRecord> Layer(const std::string& layer_name) {
    auto tx    = repository->Begin();
    auto entry = repository->FindLayerByName(*tx, layer_name);
    tx->Commit();
    return entry;
  }

  std::optional<db::model::UploadSessionRecord> Session(const std::string& session_id) {
    auto tx      = repository->Begin();
    auto session = repository->GetSession(*tx, session_id);
    tx->Commit();
    return session;
  }

  std::shared_ptr<db::memory::MemoryRepository> repository;
  std::shared_ptr<FakeMultipartStore>           store;
  std::shared_ptr<core::MultipartCoordinator>   coordinator;
  std::shared_ptr<FakeRasterConverter>          converter;
  std::shared_ptr<core::ChunkReceiver>          receiver;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

std::string Bytes(char c, size_t n) {
  return std::string(n, c);
}

void TestThreeChunkUploadRegistersLayer() {
  Harness h;
  const auto id = h.Create(300);
  assert(h.receiver->Status(id).state() == v1::UPLOAD_STATE_RECEIVING);

  auto first = h.Send(id, 0, Bytes('a', 100), 300);
  assert(first.part_number == 1);
  assert(first.status.next_expected_offset() == 100);
  assert(!first.entry);

  auto second = h.Send(id, 100, Bytes('b', 100), 300);
  assert(second.part_number == 2);
  assert(second.status.next_expected_offset() == 200);

  auto last = h.Send(id, 200, Bytes('c', 100), 300);
  assert(last.part_number == 3);
  assert(last.entry);
  assert(last.status.state() == v1::UPLOAD_STATE_FINALIZED);
  assert(last.entry->key().layer_name() == kLayerName);
  assert(last.entry->key().year() == 2010);
  assert(last.entry->min_value() == 1.0 && last.entry->max_value() == 9.0 && last.entry->global_average() == 4.5);

  const auto expected_key = std::string("layers/") + kLayerName + "/" + last.entry->id() + ".tif";
  assert(last.entry->storage_key() == expected_key);
  assert(h.store->Object(expected_key) == "COG:" + Bytes('a', 100) + Bytes('b', 100) + Bytes('c', 100));
  assert(h.converter->last_input.size() == 300);

  // Raw input removed once registered.
  assert(!h.store->Exists("inputs/" + id));
  assert(h.Layer(kLayerName)->id == last.entry->id());
  assert(h.store->complete_calls == 1);

  // Finished sessions are gone for clients.
  assert(Throws<util::NotFound>([&] { h.receiver->Status(id); }));
  assert(Throws<util::NotFound>([&] { h.Send(id, 0, Bytes('a', 100), 300); }));
  auto tx = h.repository->Begin();
  assert(h.repository->ListParts(*tx, id).empty());
  tx->Commit();
}

void TestNameCanArriveWithFirstChunk() {
  Harness h;
  const auto id = h.Create(200, "");

  assert(Throws<util::InvalidFilenameFormat>([&] { h.Send(id, 0, Bytes('a', 100), 200, ""); }));
  assert(Throws<util::InvalidFilenameFormat>([&] { h.Send(id, 0, Bytes('a', 100), 200, "not-a-layer.tif"); }));
  assert(h.store->upload_part_calls == 0);

  h.Send(id, 0, Bytes('a', 100), 200);
  assert(h.receiver->Status(id).declared_name() == kName);

  // Later chunks may omit the name, but may not change it.
  assert(Throws<util::InvalidChunk>([&] { h.Send(id, 100, Bytes('b', 100), 200, "maize_yield.tif"); }));
  auto last = h.Send(id, 100, Bytes('b', 100), 200, "");
  assert(last.entry);
}

void TestCreateValidatesEagerly() {
  Harness h;
  assert(Throws<util::InvalidFilenameFormat>([&] { h.Create(100, "wheat_unknown.tif"); }));
  assert(Throws<util::InvalidChunk>([&] { h.Create(0); }));
  assert(h.store->initiate_calls == 0);
}

void TestChunkValidation() {
  Harness h;
  const auto id = h.Create(300);

  assert(Throws<util::InvalidChunk>([&] { h.Send(id, 0, Bytes('a', 100), 301); }));
  assert(Throws<util::InvalidChunk>([&] { h.Send(id, 250, Bytes('a', 100), 300); }));
  assert(Throws<util::InvalidChunk>([&] {
    core::ChunkRequest request;
    request.session_id     = id;
    request.total_length   = 300;
    request.content_length = 100;
    request.name           = kName;
    request.data           = MakeBuffer(Bytes('a', 99));
    h.receiver->Chunk(request);
  }));
  assert(Throws<util::NotFound>([&] { h.Send("missing", 0, Bytes('a', 100), 300); }));

  h.Send(id, 0, Bytes('a', 100), 300);
  assert(Throws<util::InvalidChunk>([&] { h.Send(id, 100, Bytes('b', 50), 300); }));
  assert(h.receiver->Status(id).part_count() == 1);
}

void TestOutOfOrderAndRetriedChunks() {
  Harness h;
  const auto id = h.Create(300);

  auto middle = h.Send(id, 100, Bytes('b', 100), 300);
  assert(middle.part_number == 2);
  assert(middle.status.next_expected_offset() == 0);
  assert(middle.status.received_bytes() == 100);

  h.Send(id, 0, Bytes('a', 100), 300);
  auto retried = h.Send(id, 0, Bytes('A', 100), 300);
  assert(retried.part_number == 1);
  assert(retried.status.part_count() == 2);
  assert(retried.status.received_bytes() == 200);
  assert(retried.status.next_expected_offset() == 200);

  auto last = h.Send(id, 200, Bytes('c', 100), 300);
  assert(last.entry);
  assert(h.converter->last_input == Bytes('A', 100) + Bytes('b', 100) + Bytes('c', 100));
}

void TestPartFailureLeavesSessionUntouched() {
  Harness h;
  const auto id = h.Create(200);

  h.store->fail_upload_part = 1;
  assert(Throws<util::StorageUploadFailure>([&] { h.Send(id, 0, Bytes('a', 100), 200); }));
  const auto status = h.receiver->Status(id);
  assert(status.part_count() == 0);
  assert(status.state() == v1::UPLOAD_STATE_RECEIVING);

  h.Send(id, 0, Bytes('a', 100), 200);
  assert(h.Send(id, 100, Bytes('b', 100), 200).entry);
}

void TestNonFiniteStatisticsKeepSessionCompleting() {
  Harness h;
  h.converter->statistics.max_value = std::numeric_limits<double>::infinity();

  const auto id = h.Create(300);
  h.Send(id, 0, Bytes('a', 100), 300);
  h.Send(id, 100, Bytes('b', 100), 300);
  assert(Throws<util::ValueRangeInvalid>([&] { h.Send(id, 200, Bytes('c', 100), 300); }));

  auto status = h.receiver->Status(id);
  assert(status.state() == v1::UPLOAD_STATE_COMPLETING);
  assert(status.next_expected_offset() == 300);
  assert(!status.last_error().empty());
  assert(!h.Layer(kLayerName));
  assert(h.store->Exists("inputs/" + id));

  // Chunks are no longer accepted; only a finalize retry is.
  assert(Throws<util::InvalidState>([&] { h.Send(id, 200, Bytes('c', 100), 300); }));

  h.converter->statistics.max_value = 9.0;
  auto finalized                    = h.receiver->Finalize(id);
  assert(finalized.status.state() == v1::UPLOAD_STATE_FINALIZED);
  assert(finalized.status.last_error().empty());
  assert(finalized.entry.key().layer_name() == kLayerName);
  // Storage completion is not repeated on retry.
  assert(h.store->complete_calls == 1);
}

void TestStorageCompletionFailureIsRetriedByFinalize() {
  Harness h;
  const auto id = h.Create(100);

  h.store->fail_complete = 1;
  assert(Throws<util::StorageUploadFailure>([&] { h.Send(id, 0, Bytes('a', 100), 100); }));
  assert(!h.Session(id)->storage_completed);

  auto finalized = h.receiver->Finalize(id);
  assert(finalized.entry.byte_size() == 104);
  assert(h.store->complete_calls == 2);
}

void TestFinalizeBeforeAllBytes() {
  Harness h;
  const auto id = h.Create(200);
  assert(Throws<util::IncompleteUpload>([&] { h.receiver->Finalize(id); }));
  h.Send(id, 0, Bytes('a', 100), 200);
  assert(Throws<util::IncompleteUpload>([&] { h.receiver->Finalize(id); }));
  assert(Throws<util::NotFound>([&] { h.receiver->Finalize("missing"); }));
}

void TestDuplicateLayer() {
  Harness h;
  const auto first = h.Create(100);
  auto       entry = h.Send(first, 0, Bytes('a', 100), 100).entry;
  assert(entry);

  const auto second = h.Create(100);
  assert(Throws<util::DuplicateEntry>([&] { h.Send(second, 0, Bytes('b', 100), 100); }));
  assert(h.receiver->Status(second).state() == v1::UPLOAD_STATE_COMPLETING);
  assert(h.Layer(kLayerName)->id == entry->id());

  const auto third       = h.Create(100, kName, true);
  auto       replacement = h.Send(third, 0, Bytes('c', 100), 100).entry;
  assert(replacement);
  assert(replacement->id() != entry->id());
  assert(h.Layer(kLayerName)->id == replacement->id());
  assert(!h.store->Exists(entry->storage_key()));
  assert(h.store->Object(replacement->storage_key()) == "COG:" + Bytes('c', 100));
}

void TestAbortReleasesStorage() {
  Harness h;
  const auto id = h.Create(300);
  h.Send(id, 0, Bytes('a', 100), 300);
  const auto handle = h.Session(id)->upload_handle;
  assert(h.store->HasUpload(handle));

  h.receiver->Abort(id);
  assert(!h.store->HasUpload(handle));
  assert(h.Session(id)->state == v1::UPLOAD_STATE_ABORTED);
  assert(Throws<util::NotFound>([&] { h.receiver->Status(id); }));
  assert(Throws<util::NotFound>([&] { h.Send(id, 100, Bytes('b', 100), 300); }));
  assert(Throws<util::NotFound>([&] { h.receiver->Abort(id); }));
}

void TestAbortAfterStorageCompletionRemovesRawObject() {
  Harness h;
  h.converter->fail_conversion = true;
  const auto id                = h.Create(100);
  assert(Throws<util::RasterConversionFailure>([&] { h.Send(id, 0, Bytes('a', 100), 100); }));
  assert(h.store->Exists("inputs/" + id));

  h.receiver->Abort(id);
  assert(!h.store->Exists("inputs/" + id));
}

void TestInitiateFailureAbortsSession() {
  Harness h;
  h.store->fail_initiate = true;
  assert(Throws<util::StorageUploadFailure>([&] { h.Create(100); }));

  auto tx    = h.repository->Begin();
  auto stale = h.repository->ListStaleSessions(*tx, std::numeric_limits<uint64_t>::max());
  tx->Commit();
  assert(stale.empty());
}

void TestExpireIfStale() {
  Harness h;
  const auto id = h.Create(200);
  h.Send(id, 0, Bytes('a', 100), 200);

  assert(!h.receiver->ExpireIfStale(id, 0));
  assert(h.receiver->ExpireIfStale(id, std::numeric_limits<uint64_t>::max()));
  assert(h.Session(id)->state == v1::UPLOAD_STATE_ABORTED);
  assert(!h.receiver->ExpireIfStale(id, std::numeric_limits<uint64_t>::max()));
}

void TestUnknownSessionsLeaveNoLocks() {
  Harness h;
  for (int i = 0; i < 100; ++i) {
    const auto id = "missing-" + std::to_string(i);
    assert(Throws<util::NotFound>([&] { h.receiver->Status(id); }));
    assert(Throws<util::NotFound>([&] { h.receiver->Finalize(id); }));
    assert(Throws<util::NotFound>([&] { h.receiver->Abort(id); }));
    assert(Throws<util::NotFound>([&] { h.Send(id, 0, Bytes('a', 10), 10); }));
  }
  assert(h.receiver->TrackedSessionCount() == 0);

  // Live and finished sessions hold no lock between calls either.
  const auto live = h.Create(200);
  h.Send(live, 0, Bytes('a', 100), 200);
  const auto done = h.Create(100);
  assert(h.Send(done, 0, Bytes('b', 100), 100).entry);
  assert(Throws<util::NotFound>([&] { h.receiver->Status(done); }));
  assert(h.receiver->TrackedSessionCount() == 0);
  assert(h.receiver->Status(live).next_expected_offset() == 100);
}

void TestConcurrentChunksFinalizeOnce() {
  Harness h;
  constexpr int kChunks = 8;
  const auto    id      = h.Create(kChunks * 64);

  std::vector<std::thread> workers;
  std::vector<int>         finalized(kChunks, 0);
  for (int i = kChunks - 1; i >= 0; --i) {
    workers.emplace_back([&, i] {
      // The final chunk is refused until some earlier chunk fixes the chunk size.
      for (;;) {
        try {
          auto outcome = h.Send(id, static_cast<uint64_t>(i) * 64, Bytes(static_cast<char>('a' + i), 64), kChunks * 64);
          finalized[i] = outcome.entry ? 1 : 0;
          return;
        } catch (const util::InvalidChunk&) {
          assert(i == kChunks - 1);
          std::this_thread::yield();
        }
      }
    });
  }
  for (auto& worker : workers) worker.join();

  int total = 0;
  for (int f : finalized) total += f;
  assert(total == 1);
  assert(h.Session(id)->state == v1::UPLOAD_STATE_FINALIZED);
  assert(h.converter->calls == 1);
}

} // namespace

int main() {
  TestThreeChunkUploadRegistersLayer();
  TestNameCanArriveWithFirstChunk();
  TestCreateValidatesEagerly();
  TestChunkValidation();
  TestOutOfOrderAndRetriedChunks();
  TestPartFailureLeavesSessionUntouched();
  TestNonFiniteStatisticsKeepSessionCompleting();
  TestStorageCompletionFailureIsRetriedByFinalize();
  TestFinalizeBeforeAllBytes();
  TestDuplicateLayer();
  TestAbortReleasesStorage();
  TestAbortAfterStorageCompletionRemovesRawObject();
  TestInitiateFailureAbortsSession();
  TestExpireIfStale();
  TestUnknownSessionsLeaveNoLocks();
  TestConcurrentChunksFinalizeOnce();

  std::cout << "chunk_receiver_test: pass\n";
  return 0;
}
