#ifndef BASE_MODEL_HPP
#define BASE_MODEL_HPP

#include <cstddef>
#include <string>
#include <vector>

// A loaded, read-only binary classifier. Implementations must allow
// concurrent calls to predict_probability.
class IClassificationModel {
public:
  virtual ~IClassificationModel() = default;

  // Calibrated probability of the malicious class for one feature row.
  virtual double predict_probability(const std::vector<double> &features) const = 0;

  virtual const std::string &model_version() const = 0;
  virtual int feature_schema_version() const = 0;
  virtual size_t input_width() const = 0;
};

#endif // BASE_MODEL_HPP
