#pragma once

#include "embedding/embedding_provider.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agentwatch::embedding {

using ProviderFactory =
    std::function<std::unique_ptr<IEmbeddingProvider>(std::string& error)>;

// Owns one embedding provider that is expensive to construct. The provider is
// built from `factory` on the first `Embed` call and reused afterwards.
//
// A failed construction is reported to that caller and retried on the next
// call. `Reset()` drops the provider so the next call constructs a new one.
class EmbeddingBackend {
public:
  // Uses the built-in hashing provider.
  EmbeddingBackend();
  explicit EmbeddingBackend(ProviderFactory factory);

  EmbeddingBackend(const EmbeddingBackend&) = delete;
  EmbeddingBackend& operator=(const EmbeddingBackend&) = delete;

  bool Embed(std::string_view text, std::vector<float>& vector, std::string& error);

  bool IsLoaded() const;
  void Reset();

private:
  ProviderFactory factory_;
  mutable std::mutex mutex_;
  std::shared_ptr<IEmbeddingProvider> provider_;
};

} // namespace agentwatch::embedding
