#include "classifier.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "models/model_metadata.hpp"
#include "models/onnx_model.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

Classifier::Classifier(std::shared_ptr<const IClassificationModel> model,
                       double decision_threshold)
    : model_(std::move(model)), decision_threshold_(decision_threshold) {
  if (!model_)
    throw ModelLoadError("Classifier constructed without a model");
}

std::shared_ptr<const Classifier>
Classifier::load(const Config::ClassifierConfig &config) {
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Loading classifier from " << config.model_path);

  ModelMetadata metadata = load_model_metadata(config.model_metadata_path);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(config.model_path, ec))
    throw ModelLoadError("Model artifact not found: " + config.model_path);

  auto model = std::make_shared<const ONNXModel>(config.model_path,
                                                 std::move(metadata));
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Classifier ready with model version " << model->model_version()
                                             << ", threshold "
                                             << config.decision_threshold);
  return std::make_shared<const Classifier>(std::move(model),
                                            config.decision_threshold);
}

Prediction Classifier::classify(const FeatureVector &vector) const {
  if (vector.schema_version != model_->feature_schema_version())
    throw SchemaMismatchError(
        "Feature vector schema v" + std::to_string(vector.schema_version) +
        " cannot be scored by model " + model_->model_version() +
        " trained on schema v" +
        std::to_string(model_->feature_schema_version()));
  if (vector.values.size() != model_->input_width())
    throw SchemaMismatchError("Feature vector has " +
                              std::to_string(vector.values.size()) +
                              " slots, model " + model_->model_version() +
                              " expects " +
                              std::to_string(model_->input_width()));

  double probability = 0.0;
  try {
    probability = model_->predict_probability(vector.values);
  } catch (const WafError &) {
    throw;
  } catch (const std::exception &e) {
    throw InferenceError("Model " + model_->model_version() +
                         " failed to score: " + e.what());
  }
  if (!std::isfinite(probability))
    throw WafError("Model returned a non-finite probability");

  Prediction prediction;
  prediction.confidence = std::clamp(probability, 0.0, 1.0);
  prediction.label = prediction.confidence >= decision_threshold_
                         ? Label::MALICIOUS
                         : Label::BENIGN;
  return prediction;
}
