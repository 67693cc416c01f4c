#include "models/onnx_model.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"

#include <array>
#include <utility>

ONNXModel::ONNXModel(const std::string &model_path, ModelMetadata metadata) try
    : metadata_(std::move(metadata)),
      env_(ORT_LOGGING_LEVEL_WARNING, "waf-hardener-onnx"),
      session_(env_, model_path.c_str(), Ort::SessionOptions{nullptr}) {

  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Loaded ONNX session for model " << metadata_.model_version << " from "
                                       << model_path);

  size_t num_input_nodes = session_.GetInputCount();
  if (num_input_nodes != 1)
    throw ModelLoadError("Model must have exactly one input node.");

  owned_input_names_.push_back(
      session_.GetInputNameAllocated(0, allocator_).get());
  input_node_names_.push_back(owned_input_names_.back().c_str());

  Ort::TypeInfo type_info = session_.GetInputTypeInfo(0);
  auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> input_dims = tensor_info.GetShape();
  if (input_dims.size() != 2 || input_dims[1] <= 0)
    throw ModelLoadError(
        "Model input must be a 2D tensor of shape [None, num_features].");
  input_width_ = static_cast<size_t>(input_dims[1]);

  if (metadata_.feature_names_ordered.size() != input_width_) {
    throw ModelLoadError("Feature count in metadata (" +
                         std::to_string(metadata_.feature_names_ordered.size()) +
                         ") does not match model's expected input shape (" +
                         std::to_string(input_width_) + ").");
  }

  size_t num_output_nodes = session_.GetOutputCount();
  if (num_output_nodes == 0)
    throw ModelLoadError("Model has no outputs.");
  owned_output_names_.reserve(num_output_nodes);
  output_node_names_.reserve(num_output_nodes);
  for (size_t i = 0; i < num_output_nodes; i++) {
    owned_output_names_.push_back(
        session_.GetOutputNameAllocated(i, allocator_).get());
    output_node_names_.push_back(owned_output_names_.back().c_str());
    LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
        "Model output node " << i << " name: " << owned_output_names_.back());
  }

  // skl2onnx classifiers emit (label, probabilities); default to the latter.
  probability_output_index_ = num_output_nodes >= 2 ? 1 : 0;
  if (!metadata_.probability_output.empty()) {
    bool found = false;
    for (size_t i = 0; i < owned_output_names_.size(); ++i) {
      if (owned_output_names_[i] == metadata_.probability_output) {
        probability_output_index_ = i;
        found = true;
      }
    }
    if (!found)
      throw ModelLoadError("Probability output '" +
                           metadata_.probability_output +
                           "' not found among model outputs.");
  }

  Ort::TypeInfo output_info =
      session_.GetOutputTypeInfo(probability_output_index_);
  if (output_info.GetONNXType() != ONNX_TYPE_TENSOR)
    throw ModelLoadError("Probability output '" +
                         owned_output_names_[probability_output_index_] +
                         "' is not a tensor.");

  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "ONNX model ready: " << input_width_ << " features, probabilities from '"
                           << owned_output_names_[probability_output_index_]
                           << "'.");

} catch (const Ort::Exception &e) {
  LOG(LogLevel::FATAL, LogComponent::ML_LIFECYCLE,
      "ONNX Runtime Exception while loading model: " << e.what());
  throw ModelLoadError(std::string("ONNX Runtime failed to load model: ") +
                       e.what());
}

ONNXModel::~ONNXModel() = default;

double ONNXModel::predict_probability(const std::vector<double> &features) const {
  if (features.size() != input_width_)
    throw SchemaMismatchError("Feature vector has " +
                              std::to_string(features.size()) +
                              " slots, model expects " +
                              std::to_string(input_width_));

  std::vector<float> float_features(features.begin(), features.end());
  std::array<int64_t, 2> input_shape{1, static_cast<int64_t>(input_width_)};

  Ort::MemoryInfo memory_info =
      Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      memory_info, float_features.data(), float_features.size(),
      input_shape.data(), input_shape.size());

  std::vector<Ort::Value> output_tensors;
  {
    ScopedTimer timer(PipelineMetrics::instance().inference_duration);
    output_tensors = session_.Run(
        Ort::RunOptions{nullptr}, input_node_names_.data(), &input_tensor, 1,
        output_node_names_.data(), output_node_names_.size());
  }

  Ort::Value &probabilities = output_tensors[probability_output_index_];
  auto shape_info = probabilities.GetTensorTypeAndShapeInfo();
  size_t element_count = shape_info.GetElementCount();
  if (metadata_.positive_class_index >= element_count)
    throw SchemaMismatchError("Probability tensor has " +
                              std::to_string(element_count) +
                              " classes, positive class index is " +
                              std::to_string(metadata_.positive_class_index));

  double probability = 0.0;
  if (shape_info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE)
    probability =
        probabilities.GetTensorData<double>()[metadata_.positive_class_index];
  else
    probability = static_cast<double>(
        probabilities.GetTensorData<float>()[metadata_.positive_class_index]);

  LOG(LogLevel::TRACE, LogComponent::ML_INFERENCE,
      "ONNX model probability: " << probability);
  return probability;
}
