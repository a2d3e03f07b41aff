#include "internal/metadata/filename_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using ingest::metadata::FilenameParser;
using ingest::metadata::Vocabulary;

FilenameParser DefaultParser() {
  return FilenameParser(Vocabulary::Defaults());
}

bool Rejects(const FilenameParser& parser, const std::string& filename) {
  try {
    parser.Parse(filename);
  } catch (const ingest::util::InvalidFilenameFormat&) {
    return true;
  }
  return false;
}

void TestSixTokenClimateName() {
  const auto key = DefaultParser().Parse("wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_2010.tif");
  assert(key.kind() == ingest::v1::LAYER_KIND_CLIMATE);
  assert(key.crop() == "wheat");
  assert(key.water_model() == "pcrglobwb");
  assert(key.climate_model() == "gfdlesm2m");
  assert(key.scenario() == "rcp26");
  assert(key.variable() == "vwc");
  assert(key.year() == 2010);
  assert(key.layer_name() == "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_2010");
}

void TestSevenTokenNameMergesVariableSuffix() {
  const auto key = DefaultParser().Parse("Wheat_PCRGLOBWB_GFDLESM2M_RCP26_WFB_perc_2090.TIFF");
  assert(key.variable() == "wfb_perc");
  assert(key.year() == 2090);
  assert(key.layer_name() == "wheat_pcrglobwb_gfdlesm2m_rcp26_wfb_perc_2090");
}

void TestCropNameHasNoClimateFields() {
  const auto key = DefaultParser().Parse("maize_yield.tif");
  assert(key.kind() == ingest::v1::LAYER_KIND_CROP);
  assert(key.crop() == "maize");
  assert(key.variable() == "yield");
  assert(key.water_model().empty());
  assert(key.year() == 0);
  assert(key.layer_name() == "maize_yield");
}

void TestPathIsStripped() {
  const auto key = DefaultParser().Parse("/data/uploads/rice_production.tif");
  assert(key.layer_name() == "rice_production");
}

void TestInvalidNamesAreRejected() {
  const auto parser = DefaultParser();
  assert(Rejects(parser, "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_2010.png"));
  assert(Rejects(parser, "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_2010"));
  assert(Rejects(parser, "oats_pcrglobwb_gfdlesm2m_rcp26_vwc_2010.tif"));
  assert(Rejects(parser, "wheat_pcrglobwb_gfdlesm2m_rcp45_vwc_2010.tif"));
  assert(Rejects(parser, "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_2015.tif"));
  assert(Rejects(parser, "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_20x0.tif"));
  assert(Rejects(parser, "wheat_pcrglobwb_gfdlesm2m_rcp26_vwc_bad_2010.tif"));
  assert(Rejects(parser, "wheat__yield.tif"));
  assert(Rejects(parser, "wheat.tif"));
  assert(Rejects(parser, ".tif"));
  assert(Rejects(parser, "wheat_a_b_c_d_e_f_g.tif"));
  assert(Rejects(parser, "wheat_height.tif"));
}

void TestConfiguredVocabularyReplacesDefaults() {
  ingest::runtime::config::VocabularyConfig config;
  config.add_crops("Oats");
  config.add_years(2015);

  FilenameParser parser(Vocabulary::FromConfig(config));
  assert(parser.Parse("oats_pcrglobwb_gfdlesm2m_rcp26_vwc_2015.tif").year() == 2015);
  assert(Rejects(parser, "wheat_yield.tif"));
  assert(Rejects(parser, "oats_pcrglobwb_gfdlesm2m_rcp26_vwc_2010.tif"));
  assert(parser.vocabulary().scenarios.count("rcp85") == 1);
}

} // namespace

int main() {
  TestSixTokenClimateName();
  TestSevenTokenNameMergesVariableSuffix();
  TestCropNameHasNoClimateFields();
  TestPathIsStripped();
  TestInvalidNamesAreRejected();
  TestConfiguredVocabularyReplacesDefaults();

  std::cout << "filename_parser_test: pass\n";
  return 0;
}
