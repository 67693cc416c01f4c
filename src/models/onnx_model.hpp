#ifndef ONNX_MODEL_HPP
#define ONNX_MODEL_HPP

#include "models/base_model.hpp"
#include "models/model_metadata.hpp"

#include <onnxruntime_cxx_api.h>
#include <string>
#include <vector>

class ONNXModel : public IClassificationModel {
public:
  // Metadata is loaded and checked before the session is created.
  // Throws ModelLoadError on any failure.
  ONNXModel(const std::string &model_path, ModelMetadata metadata);
  ~ONNXModel() override;

  double predict_probability(const std::vector<double> &features) const override;

  const std::string &model_version() const override {
    return metadata_.model_version;
  }
  int feature_schema_version() const override {
    return metadata_.feature_schema_version;
  }
  size_t input_width() const override { return input_width_; }

private:
  ModelMetadata metadata_;

  // ONNX Runtime objects. Session::Run is safe to call concurrently.
  Ort::Env env_;
  mutable Ort::Session session_;
  Ort::AllocatorWithDefaultOptions allocator_;

  std::vector<const char *> input_node_names_;
  std::vector<const char *> output_node_names_;
  size_t input_width_ = 0;
  size_t probability_output_index_ = 0;

  // Backing storage for the C-string name arrays above
  std::vector<std::string> owned_input_names_;
  std::vector<std::string> owned_output_names_;
};

#endif // ONNX_MODEL_HPP
