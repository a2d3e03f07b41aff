#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ingest/v1/types.pb.h"
#include "vocabulary.hpp"

namespace ingest::metadata {

/*
  Parses a layer filename into its structured key.

  Accepted forms (lower-cased, extension .tif or .tiff):

    crop_watermodel_climatemodel_scenario_variable_year           (6 tokens)
    crop_watermodel_climatemodel_scenario_variable_suffix_year    (7 tokens)
    crop_cropvariable                                             (2..5 tokens,
                                                                   joined variable)

  Throws util::InvalidFilenameFormat on any other shape or on a token outside
  its vocabulary. Pure; safe to call from any thread.
*/
class FilenameParser {
 public:
  explicit FilenameParser(Vocabulary vocabulary);

  ingest::v1::LayerKey Parse(std::string_view filename) const;

  // Lower-cased name with the raster extension removed.
  static std::string Stem(std::string_view filename);

  const Vocabulary& vocabulary() const {
    return vocabulary_;
  }

 private:
  ingest::v1::LayerKey ParseClimate(const std::vector<std::string>& tokens) const;
  ingest::v1::LayerKey ParseCrop(const std::vector<std::string>& tokens) const;

  Vocabulary vocabulary_;
};

// Canonical catalog name of a key; unique per logical dataset.
std::string LayerName(const ingest::v1::LayerKey& key);

} // namespace ingest::metadata
