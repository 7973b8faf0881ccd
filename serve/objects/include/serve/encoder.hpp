#pragma once

#include <string>
#include <string_view>

namespace serve {

// One-shot compressor of a full response body. Not thread safe: each event loop owns its encoders.
// Implementations throw std::runtime_error on fatal codec errors.
class Encoder {
 public:
  virtual ~Encoder() = default;

  // Appends the compressed form of 'data' to 'out'.
  virtual void encodeFull(std::string_view data, std::string& out) = 0;
};

}  // namespace serve
