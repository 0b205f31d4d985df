#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agentwatch::embedding {

// Text-to-vector capability used by goal drift scoring.
//
// Contract:
// - every successful call for one provider instance returns vectors of the
//   same length
// - `Embed` is safe to call from several threads at once
class IEmbeddingProvider {
public:
  virtual ~IEmbeddingProvider() = default;

  // Stable identifier used in logs (`hashing-384`, ...).
  virtual std::string Name() const = 0;

  virtual bool Embed(std::string_view text, std::vector<float>& vector,
                     std::string& error) = 0;
};

} // namespace agentwatch::embedding
