#pragma once

#include <string>
#include <vector>

namespace sage_core {

// Anything that can turn text into a dense vector
class EmbeddingBackend {
 public:
  virtual ~EmbeddingBackend() = default;

  // Prepare the model (connect, pull, warm up). Called at most once per successful load.
  virtual void load() = 0;

  virtual std::vector<float> embed(const std::string &text) = 0;

  virtual std::string model_name() const = 0;
};

}  // namespace sage_core
