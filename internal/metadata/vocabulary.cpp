#include "vocabulary.hpp"

#include <algorithm>
#include <cctype>

#include "config/config.pb.h"

namespace ingest::metadata {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

template <typename RepeatedField>
void Override(std::set<std::string>& target, const RepeatedField& configured) {
  if (configured.empty()) {
    return;
  }
  target.clear();
  for (const auto& value : configured) {
    target.insert(Lower(value));
  }
}

} // namespace

Vocabulary Vocabulary::Defaults() {
  Vocabulary v;
  v.crops             = {"barley", "maize", "potato", "rice", "sorghum", "soy", "sugarcane", "wheat"};
  v.water_models      = {"cwatm", "h08", "lpjml", "matsiro", "pcrglobwb", "watergap2"};
  v.climate_models    = {"gfdlesm2m", "hadgem2es", "ipslcm5alr", "miroc5"};
  v.scenarios         = {"historical", "rcp26", "rcp60", "rcp85"};
  v.variables         = {"vwc", "vwcb", "vwcg", "wf", "wfb", "wfg", "etb", "etg", "rb", "rg", "wdb", "wdg"};
  v.variable_suffixes = {"perc"};
  v.crop_variables    = {"yield", "production"};
  for (int year = 2000; year < 2100; year += 10) {
    v.years.insert(year);
  }
  return v;
}

Vocabulary Vocabulary::FromConfig(const ingest::runtime::config::VocabularyConfig& config) {
  auto v = Defaults();
  Override(v.crops, config.crops());
  Override(v.water_models, config.water_models());
  Override(v.climate_models, config.climate_models());
  Override(v.scenarios, config.scenarios());
  Override(v.variables, config.variables());
  Override(v.variable_suffixes, config.variable_suffixes());
  Override(v.crop_variables, config.crop_variables());
  if (!config.years().empty()) {
    v.years.clear();
    v.years.insert(config.years().begin(), config.years().end());
  }
  return v;
}

std::string JoinSorted(const std::set<std::string>& values) {
  std::string out;
  for (const auto& value : values) {
    if (!out.empty()) {
      out += ", ";
    }
    out += value;
  }
  return out;
}

} // namespace ingest::metadata
