#pragma once

#include "ingest/v1/types.pb.h"

namespace ingest::model {

using ingest::v1::UploadState;

constexpr bool IsTerminal(UploadState state) {
  return state == ingest::v1::UPLOAD_STATE_FINALIZED || state == ingest::v1::UPLOAD_STATE_ABORTED;
}

/*
  Created -> Receiving -> Completing -> Finalized
  Aborted is reachable from every non-terminal state.
*/
constexpr bool CanTransition(UploadState from, UploadState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == ingest::v1::UPLOAD_STATE_ABORTED) {
    return true;
  }

  switch (from) {
    case ingest::v1::UPLOAD_STATE_CREATED:
      return to == ingest::v1::UPLOAD_STATE_RECEIVING;
    case ingest::v1::UPLOAD_STATE_RECEIVING:
      return to == ingest::v1::UPLOAD_STATE_RECEIVING || to == ingest::v1::UPLOAD_STATE_COMPLETING;
    case ingest::v1::UPLOAD_STATE_COMPLETING:
      return to == ingest::v1::UPLOAD_STATE_COMPLETING || to == ingest::v1::UPLOAD_STATE_FINALIZED;
    default:
      return false;
  }
}

} // namespace ingest::model
