#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include "core/classification_result.hpp"
#include "core/config.hpp"
#include "models/base_model.hpp"
#include "models/feature_extractor.hpp"

#include <memory>
#include <string>

struct Prediction {
  Label label = Label::BENIGN;
  double confidence = 0.0; // P(malicious)
};

// Shares one loaded model across worker threads; every public member is const
// and safe to call concurrently.
class Classifier {
public:
  Classifier(std::shared_ptr<const IClassificationModel> model,
             double decision_threshold);

  // Metadata first, then the ONNX session. Throws ModelLoadError.
  static std::shared_ptr<const Classifier>
  load(const Config::ClassifierConfig &config);

  // Throws SchemaMismatchError when the vector was produced by a different
  // extractor schema or has the wrong width, InferenceError when the backend
  // fails, and WafError when it answers with a non-finite probability.
  Prediction classify(const FeatureVector &vector) const;

  const std::string &model_version() const { return model_->model_version(); }
  int feature_schema_version() const { return model_->feature_schema_version(); }
  double decision_threshold() const { return decision_threshold_; }

private:
  std::shared_ptr<const IClassificationModel> model_;
  double decision_threshold_;
};

#endif // CLASSIFIER_HPP
