#include "model_metadata.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "features.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ModelMetadata parse_model_metadata(const std::string &json_text,
                                   const std::string &source_name) {
  json data;
  try {
    data = json::parse(json_text);
  } catch (const json::parse_error &e) {
    throw ModelLoadError("Model metadata " + source_name +
                         " is not valid JSON: " + e.what());
  }

  ModelMetadata metadata;
  try {
    metadata.model_version = data.at("model_version").get<std::string>();
    metadata.feature_schema_version = data.at("feature_schema_version").get<int>();
    metadata.feature_names_ordered =
        data.at("feature_names_ordered").get<std::vector<std::string>>();
    metadata.probability_output = data.value("probability_output", std::string());
    metadata.positive_class_index = data.value("positive_class_index", size_t{1});
  } catch (const json::exception &e) {
    throw ModelLoadError("Model metadata " + source_name +
                         " is missing a required field: " + e.what());
  }

  if (metadata.model_version.empty())
    throw ModelLoadError("Model metadata " + source_name +
                         " declares an empty model_version");

  if (metadata.feature_schema_version != FEATURE_SCHEMA_VERSION)
    throw ModelLoadError(
        "Model was trained against feature schema v" +
        std::to_string(metadata.feature_schema_version) +
        " but this build extracts v" + std::to_string(FEATURE_SCHEMA_VERSION));

  const auto &expected = feature_names_ordered();
  if (metadata.feature_names_ordered != expected) {
    std::string detail =
        "expected " + std::to_string(expected.size()) + " features, got " +
        std::to_string(metadata.feature_names_ordered.size());
    for (size_t i = 0;
         i < std::min(expected.size(), metadata.feature_names_ordered.size()); ++i) {
      if (expected[i] != metadata.feature_names_ordered[i]) {
        detail += "; first difference at slot " + std::to_string(i) + " ('" +
                  metadata.feature_names_ordered[i] + "' vs '" + expected[i] + "')";
        break;
      }
    }
    throw ModelLoadError("Model feature names do not match the extractor: " +
                         detail);
  }

  LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
      "Loaded metadata for model " << metadata.model_version << " with "
                                   << metadata.feature_names_ordered.size()
                                   << " features.");
  return metadata;
}

ModelMetadata load_model_metadata(const std::string &metadata_path) {
  LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
      "Loading model metadata from: " << metadata_path);
  auto content = Utils::read_file(metadata_path);
  if (!content)
    throw ModelLoadError("Could not open model metadata file: " + metadata_path);
  return parse_model_metadata(*content, metadata_path);
}
