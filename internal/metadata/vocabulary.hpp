#pragma once

#include <set>
#include <string>

namespace ingest::runtime::config {
class VocabularyConfig;
}

namespace ingest::metadata {

/*
  Enumerated vocabularies a layer filename is validated against.

  Every token is compared lower-cased. An empty list in configuration keeps
  the built-in list for that field.
*/
struct Vocabulary {
  std::set<std::string> crops;
  std::set<std::string> water_models;
  std::set<std::string> climate_models;
  std::set<std::string> scenarios;
  std::set<std::string> variables;
  std::set<std::string> variable_suffixes;
  std::set<std::string> crop_variables;
  std::set<int>         years;

  static Vocabulary Defaults();
  static Vocabulary FromConfig(const ingest::runtime::config::VocabularyConfig& config);
};

std::string JoinSorted(const std::set<std::string>& values);

} // namespace ingest::metadata
