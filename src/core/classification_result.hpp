#ifndef CLASSIFICATION_RESULT_HPP
#define CLASSIFICATION_RESULT_HPP

#include <cstdint>
#include <string>

enum class Label { BENIGN, MALICIOUS };

inline const char *label_to_string(Label label) {
  return label == Label::MALICIOUS ? "malicious" : "benign";
}

struct ClassificationResult {
  std::string record_id;
  Label label = Label::BENIGN;
  double confidence = 0.0; // P(malicious)
  std::string model_version;
  int feature_schema_version = 0;
  uint64_t classified_at_ms = 0;
};

#endif // CLASSIFICATION_RESULT_HPP
