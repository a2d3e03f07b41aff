#pragma once

#include "raster_converter.hpp"

namespace ingest::raster {

/*
  Converts GeoTIFF bytes to a cloud-optimized GeoTIFF entirely in GDAL's
  /vsimem/ filesystem. No overviews are built.

  Statistics are exact: min/max by a full scan of band 1, mean from the
  band statistics.
*/
class GdalCogConverter final : public RasterConverter {
 public:
  GdalCogConverter();

  ConvertedRaster Convert(const std::shared_ptr<arrow::Buffer>& input, const std::string& name) override;
};

} // namespace ingest::raster
