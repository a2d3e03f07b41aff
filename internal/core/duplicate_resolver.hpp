#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/core/multipart_coordinator.hpp"
#include "internal/db/api/repository.hpp"

namespace ingest::core {

/*
  Exact-key duplicate check before a layer is registered.

  layer_name encodes every key field, so equality on it is equality on the
  key. With overwrite the existing entry is deleted and then its object is
  removed; otherwise util::DuplicateEntry is thrown and nothing changes.
*/
class DuplicateResolver {
 public:
  DuplicateResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<MultipartCoordinator> coordinator, bool default_overwrite);

  // Returns the entry that was replaced, if any.
  std::optional<db::model::CatalogEntryRecord> Resolve(const std::string& layer_name, std::optional<bool> overwrite);

  bool default_overwrite() const {
    return default_overwrite_;
  }

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<MultipartCoordinator> coordinator_;
  bool                                  default_overwrite_;
};

} // namespace ingest::core
