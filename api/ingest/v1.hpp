#pragma once

#include "ingest/v1/types.pb.h"
#include "ingest/v1/upload_service.pb.h"
#include "ingest/v1/upload_service.grpc.pb.h"
