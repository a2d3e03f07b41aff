#include "upload_service.hpp"

#include <arrow/buffer.h>

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/core/chunk_receiver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace ingest::service {

using namespace ingest::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* session_id, Fn&& fn) {
  ingest::observability::SpanScope span(route);
  if (session_id) {
    span.SetSession(*session_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    ingest::observability::Metrics::Instance().RecordRequest(route, success);
    ingest::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    INGEST_LOG_ERROR("RPC failed", {ingest::observability::StringField("route", route), ingest::observability::StringField("error", ex.what()),
                                    ingest::observability::SessionField(session_id ? *session_id : std::string())});
    finish(false);
    throw;
  }
}

void RequireSessionId(const std::string& session_id) {
  if (session_id.empty()) {
    throw ingest::util::NotFound("session_id is required");
  }
}

} // namespace

UploadService::UploadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.receiver) {
    throw std::invalid_argument("upload service requires a chunk receiver");
  }
}

CreateUploadResponse UploadService::CreateUpload(const CreateUploadRequest& req) {
  return ObserveRpc("UploadService.CreateUpload", nullptr, [&] {
    core::CreateRequest create;
    create.total_length = req.total_length();
    create.content_type = req.content_type();
    create.owner        = req.owner();
    create.name         = req.name();
    if (req.has_overwrite()) {
      create.overwrite = req.overwrite();
    }

    CreateUploadResponse resp;
    *resp.mutable_status() = ctx_.receiver->Create(create);
    resp.set_session_id(resp.status().session_id());
    return resp;
  });
}

UploadChunkResponse UploadService::UploadChunk(const UploadChunkRequest& req) {
  return ObserveRpc("UploadService.UploadChunk", &req.session_id(), [&] {
    RequireSessionId(req.session_id());

    core::ChunkRequest chunk;
    chunk.session_id     = req.session_id();
    chunk.offset         = req.offset();
    chunk.total_length   = req.total_length();
    chunk.content_length = req.content_length();
    chunk.name           = req.name();
    // Borrows the request bytes; req outlives the call.
    chunk.data = std::make_shared<arrow::Buffer>(reinterpret_cast<const uint8_t*>(req.data().data()), static_cast<int64_t>(req.data().size()));

    auto outcome = ctx_.receiver->Chunk(chunk);

    UploadChunkResponse resp;
    *resp.mutable_status() = outcome.status;
    resp.set_part_number(outcome.part_number);
    if (outcome.entry) {
      resp.set_finalized(true);
      *resp.mutable_entry() = *outcome.entry;
    }
    return resp;
  });
}

GetUploadStatusResponse UploadService::GetUploadStatus(const GetUploadStatusRequest& req) {
  return ObserveRpc("UploadService.GetUploadStatus", &req.session_id(), [&] {
    RequireSessionId(req.session_id());
    GetUploadStatusResponse resp;
    *resp.mutable_status() = ctx_.receiver->Status(req.session_id());
    return resp;
  });
}

FinalizeUploadResponse UploadService::FinalizeUpload(const FinalizeUploadRequest& req) {
  return ObserveRpc("UploadService.FinalizeUpload", &req.session_id(), [&] {
    RequireSessionId(req.session_id());
    auto outcome = ctx_.receiver->Finalize(req.session_id());

    FinalizeUploadResponse resp;
    *resp.mutable_status() = outcome.status;
    *resp.mutable_entry()  = outcome.entry;
    return resp;
  });
}

void UploadService::AbortUpload(const AbortUploadRequest& req) {
  ObserveRpc("UploadService.AbortUpload", &req.session_id(), [&] {
    RequireSessionId(req.session_id());
    ctx_.receiver->Abort(req.session_id());
  });
}

} // namespace ingest::service
