#include "filename_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "internal/util/errors.hpp"

namespace ingest::metadata {

namespace {

constexpr char kDelimiter = '_';

const char* const kExpectedForms =
    "expected {crop}_{watermodel}_{climatemodel}_{scenario}_{variable}[_{suffix}]_{year}.tif or {crop}_{cropvariable}.tif";

std::vector<std::string> Split(const std::string& stem) {
  std::vector<std::string> tokens;
  std::string              current;
  for (char c : stem) {
    if (c == kDelimiter) {
      tokens.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  tokens.push_back(std::move(current));
  return tokens;
}

bool EndsWith(const std::string& value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void Require(const std::set<std::string>& vocabulary, const std::string& token, std::string_view field) {
  if (vocabulary.count(token) == 0) {
    throw util::InvalidFilenameFormat("invalid " + std::string(field) + " '" + token + "'; must be one of: " + JoinSorted(vocabulary));
  }
}

int ParseYear(const std::string& token, const std::set<int>& years) {
  int         year  = 0;
  const auto* begin = token.data();
  const auto* end   = token.data() + token.size();
  auto [ptr, ec]    = std::from_chars(begin, end, year);
  if (token.empty() || ec != std::errc() || ptr != end) {
    throw util::InvalidFilenameFormat("invalid year '" + token + "' in filename");
  }
  if (years.count(year) == 0) {
    throw util::InvalidFilenameFormat("year " + token + " is outside the configured periods");
  }
  return year;
}

} // namespace

FilenameParser::FilenameParser(Vocabulary vocabulary) : vocabulary_(std::move(vocabulary)) {
}

std::string FilenameParser::Stem(std::string_view filename) {
  std::string lower(filename);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // Clients may send a path; only the basename carries metadata.
  const auto slash = lower.find_last_of("/\\");
  if (slash != std::string::npos) {
    lower.erase(0, slash + 1);
  }

  if (EndsWith(lower, ".tiff")) {
    return lower.substr(0, lower.size() - 5);
  }
  if (EndsWith(lower, ".tif")) {
    return lower.substr(0, lower.size() - 4);
  }
  throw util::InvalidFilenameFormat("filename '" + std::string(filename) + "' must end with .tif");
}

ingest::v1::LayerKey FilenameParser::Parse(std::string_view filename) const {
  const auto stem = Stem(filename);
  if (stem.empty()) {
    throw util::InvalidFilenameFormat("filename has an empty stem; " + std::string(kExpectedForms));
  }

  const auto tokens = Split(stem);
  for (const auto& token : tokens) {
    if (token.empty()) {
      throw util::InvalidFilenameFormat("filename '" + stem + "' contains an empty token; " + kExpectedForms);
    }
  }

  switch (tokens.size()) {
    case 6:
    case 7:
      return ParseClimate(tokens);
    case 2:
    case 3:
    case 4:
    case 5:
      return ParseCrop(tokens);
    default:
      throw util::InvalidFilenameFormat("filename '" + stem + "' has " + std::to_string(tokens.size()) + " tokens; " + kExpectedForms);
  }
}

ingest::v1::LayerKey FilenameParser::ParseClimate(const std::vector<std::string>& tokens) const {
  Require(vocabulary_.crops, tokens[0], "crop");
  Require(vocabulary_.water_models, tokens[1], "water model");
  Require(vocabulary_.climate_models, tokens[2], "climate model");
  Require(vocabulary_.scenarios, tokens[3], "scenario");
  Require(vocabulary_.variables, tokens[4], "variable");

  std::string variable = tokens[4];
  if (tokens.size() == 7) {
    Require(vocabulary_.variable_suffixes, tokens[5], "variable suffix");
    variable += kDelimiter;
    variable += tokens[5];
  }

  ingest::v1::LayerKey key;
  key.set_kind(ingest::v1::LAYER_KIND_CLIMATE);
  key.set_crop(tokens[0]);
  key.set_water_model(tokens[1]);
  key.set_climate_model(tokens[2]);
  key.set_scenario(tokens[3]);
  key.set_variable(variable);
  key.set_year(ParseYear(tokens.back(), vocabulary_.years));
  key.set_layer_name(LayerName(key));
  return key;
}

ingest::v1::LayerKey FilenameParser::ParseCrop(const std::vector<std::string>& tokens) const {
  Require(vocabulary_.crops, tokens[0], "crop");

  std::string variable;
  for (size_t i = 1; i < tokens.size(); ++i) {
    if (!variable.empty()) {
      variable += kDelimiter;
    }
    variable += tokens[i];
  }
  Require(vocabulary_.crop_variables, variable, "crop variable");

  ingest::v1::LayerKey key;
  key.set_kind(ingest::v1::LAYER_KIND_CROP);
  key.set_crop(tokens[0]);
  key.set_variable(variable);
  key.set_layer_name(LayerName(key));
  return key;
}

std::string LayerName(const ingest::v1::LayerKey& key) {
  if (key.kind() == ingest::v1::LAYER_KIND_CROP) {
    return key.crop() + kDelimiter + key.variable();
  }
  return key.crop() + kDelimiter + key.water_model() + kDelimiter + key.climate_model() + kDelimiter + key.scenario() + kDelimiter + key.variable() +
         kDelimiter + std::to_string(key.year());
}

} // namespace ingest::metadata
