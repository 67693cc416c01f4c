#ifndef MODEL_METADATA_HPP
#define MODEL_METADATA_HPP

#include <cstddef>
#include <string>
#include <vector>

// The JSON file shipped beside each model artifact.
struct ModelMetadata {
  std::string model_version;
  int feature_schema_version = 0;
  std::vector<std::string> feature_names_ordered;

  // Output tensor holding class probabilities; empty means the second output
  // when there are two (label, probabilities), else the first.
  std::string probability_output;
  size_t positive_class_index = 1;
};

// Throws ModelLoadError when the file is missing or corrupt, when the schema
// version is not the one this build's extractor produces, or when the feature
// names disagree with the extractor's slot order.
ModelMetadata load_model_metadata(const std::string &metadata_path);

ModelMetadata parse_model_metadata(const std::string &json_text,
                                   const std::string &source_name);

#endif // MODEL_METADATA_HPP
