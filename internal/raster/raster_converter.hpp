#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace ingest::raster {

// Band 1 value range of a converted raster.
struct RasterStatistics {
  double min_value = 0.0;
  double max_value = 0.0;
  double mean      = 0.0;
};

struct ConvertedRaster {
  std::shared_ptr<arrow::Buffer> data;
  RasterStatistics               statistics;
};

/*
  Conversion & statistics stage.

  Implementations throw util::RasterConversionFailure when the input cannot
  be read or converted, and util::ValueRangeInvalid when any statistic is
  not finite.
*/
class RasterConverter {
 public:
  virtual ~RasterConverter() = default;

  virtual ConvertedRaster Convert(const std::shared_ptr<arrow::Buffer>& input, const std::string& name) = 0;
};

using RasterConverterPtr = std::shared_ptr<RasterConverter>;

} // namespace ingest::raster
