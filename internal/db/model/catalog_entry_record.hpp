#pragma once

#include <cstdint>
#include <string>

#include "ingest/v1/types.pb.h"

namespace ingest::db::model {

/*
  Registered layer. layer_name is unique across the catalog; that
  constraint is what makes registration exactly-once.
*/

struct CatalogEntryRecord {
  std::string id; // UUID string
  std::string layer_name;

  ingest::v1::LayerKind kind = ingest::v1::LAYER_KIND_UNSPECIFIED;
  std::string           crop;
  std::string           water_model;
  std::string           climate_model;
  std::string           scenario;
  std::string           variable;
  int32_t               year = 0;

  std::string filename;
  std::string storage_key;
  uint64_t    byte_size = 0;

  double min_value      = 0.0;
  double max_value      = 0.0;
  double global_average = 0.0;

  bool     enabled        = true;
  uint64_t uploaded_at_ms = 0;
};

} // namespace ingest::db::model
