#include "gdal_cog_converter.hpp"

#include <arrow/buffer.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>

#include <cmath>
#include <cstring>
#include <mutex>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ingest::raster {

namespace {

std::once_flag g_register_once;

std::string LastGdalError(const std::string& fallback) {
  const char* message = CPLGetLastErrorMsg();
  if (message == nullptr || *message == '\0') {
    return fallback;
  }
  return message;
}

/*
  A /vsimem/ file that is unlinked when the scope ends.
*/
class MemFile {
 public:
  explicit MemFile(std::string path) : path_(std::move(path)) {
  }
  ~MemFile() {
    VSIUnlink(path_.c_str());
  }

  MemFile(const MemFile&)            = delete;
  MemFile& operator=(const MemFile&) = delete;

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
};

struct PixelCensus {
  uint64_t finite     = 0;
  uint64_t non_finite = 0;
};

// Counts band pixels that are not nodata, split by whether they are finite.
PixelCensus TakeCensus(GDALRasterBand& band, const std::string& name) {
  int        has_nodata = FALSE;
  const auto nodata     = band.GetNoDataValue(&has_nodata);
  const int  width      = band.GetXSize();
  const int  height     = band.GetYSize();

  PixelCensus         census;
  std::vector<double> row(static_cast<size_t>(width));
  for (int y = 0; y < height; ++y) {
    if (band.RasterIO(GF_Read, 0, y, width, 1, row.data(), width, 1, GDT_Float64, 0, 0, nullptr) != CE_None) {
      throw util::RasterConversionFailure(name + ": " + LastGdalError("cannot read band 1"));
    }
    for (double value : row) {
      if (std::isnan(value) || (has_nodata && value == nodata)) continue;
      if (std::isfinite(value)) {
        ++census.finite;
      } else {
        ++census.non_finite;
      }
    }
  }
  return census;
}

/*
  GDAL refuses statistics for a band without valid pixels. That, like an
  infinite value, is a value-range problem rather than a broken raster.
*/
void CheckValueRange(GDALRasterBand& band, const std::string& name) {
  const auto census = TakeCensus(band, name);
  if (census.finite == 0) {
    throw util::ValueRangeInvalid(name + ": band 1 has no valid pixels");
  }
  if (census.non_finite > 0) {
    throw util::ValueRangeInvalid(name + ": band 1 holds " + std::to_string(census.non_finite) + " infinite values");
  }
}

[[noreturn]] void ThrowStatisticsFailure(GDALRasterBand& band, const std::string& name, const std::string& gdal_error) {
  CheckValueRange(band, name);
  throw util::RasterConversionFailure(name + ": " + gdal_error);
}

RasterStatistics ComputeStatistics(GDALDataset& dataset, const std::string& name) {
  if (dataset.GetRasterCount() < 1) {
    throw util::RasterConversionFailure(name + ": raster has no bands");
  }
  GDALRasterBand* band = dataset.GetRasterBand(1);

  // GDAL versions differ on whether infinities enter the statistics.
  if (GDALDataTypeIsFloating(band->GetRasterDataType())) {
    CheckValueRange(*band, name);
  }

  double min_max[2] = {0.0, 0.0};
  CPLErrorReset();
  if (band->ComputeRasterMinMax(FALSE, min_max) != CE_None) {
    ThrowStatisticsFailure(*band, name, LastGdalError("min/max computation failed"));
  }

  double min = 0.0, max = 0.0, mean = 0.0, stddev = 0.0;
  CPLErrorReset();
  if (band->ComputeStatistics(FALSE, &min, &max, &mean, &stddev, nullptr, nullptr) != CE_None) {
    ThrowStatisticsFailure(*band, name, LastGdalError("statistics computation failed"));
  }

  RasterStatistics statistics;
  statistics.min_value = min_max[0];
  statistics.max_value = min_max[1];
  statistics.mean      = mean;

  if (!std::isfinite(statistics.min_value) || !std::isfinite(statistics.max_value) || !std::isfinite(statistics.mean)) {
    throw util::ValueRangeInvalid(name + ": raster value range is not finite (min=" + std::to_string(statistics.min_value) +
                                  ", max=" + std::to_string(statistics.max_value) + ", mean=" + std::to_string(statistics.mean) + ")");
  }
  return statistics;
}

} // namespace

GdalCogConverter::GdalCogConverter() {
  std::call_once(g_register_once, [] { GDALAllRegister(); });
}

ConvertedRaster GdalCogConverter::Convert(const std::shared_ptr<arrow::Buffer>& input, const std::string& name) {
  if (!input || input->size() == 0) {
    throw util::RasterConversionFailure(name + ": empty raster");
  }

  const auto id = util::NewId();
  MemFile    source("/vsimem/layer-ingest/" + id + "/input.tif");
  MemFile    target("/vsimem/layer-ingest/" + id + "/output.tif");

  // GDAL reads the caller's bytes in place; the buffer outlives the file.
  VSILFILE* handle = VSIFileFromMemBuffer(source.path().c_str(), const_cast<GByte*>(input->data()), static_cast<vsi_l_offset>(input->size()),
                                          FALSE);
  if (handle == nullptr) {
    throw util::RasterConversionFailure(name + ": " + LastGdalError("cannot stage raster in memory"));
  }
  VSIFCloseL(handle);

  CPLErrorReset();
  GDALDatasetUniquePtr dataset(GDALDataset::Open(source.path().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
  if (!dataset) {
    throw util::RasterConversionFailure(name + ": " + LastGdalError("not a readable raster"));
  }

  ConvertedRaster result;
  result.statistics = ComputeStatistics(*dataset, name);

  GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("COG");
  if (driver == nullptr) {
    throw util::RasterConversionFailure("GDAL COG driver is not available");
  }

  CPLStringList options;
  options.AddString("OVERVIEWS=NONE");
  {
    GDALDatasetUniquePtr converted(driver->CreateCopy(target.path().c_str(), dataset.get(), FALSE, options.List(), nullptr, nullptr));
    if (!converted) {
      throw util::RasterConversionFailure(name + ": " + LastGdalError("COG conversion failed"));
    }
  }

  vsi_l_offset length = 0;
  GByte*       bytes  = VSIGetMemFileBuffer(target.path().c_str(), &length, FALSE);
  if (bytes == nullptr || length == 0) {
    throw util::RasterConversionFailure(name + ": COG output is empty");
  }
  auto buffer = storage::common::Unwrap(arrow::AllocateBuffer(static_cast<int64_t>(length)));
  std::memcpy(buffer->mutable_data(), bytes, static_cast<size_t>(length));
  result.data = std::shared_ptr<arrow::Buffer>(std::move(buffer));

  INGEST_LOG_INFO("Raster converted", {observability::StringField("name", name), observability::IntField("input_bytes", input->size()),
                                       observability::IntField("output_bytes", static_cast<int64_t>(length)),
                                       observability::DoubleField("min", result.statistics.min_value),
                                       observability::DoubleField("max", result.statistics.max_value),
                                       observability::DoubleField("mean", result.statistics.mean)});
  return result;
}

} // namespace ingest::raster
