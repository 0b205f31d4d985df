#include "embedding/embedding_backend.hpp"

#include "embedding/hashing_embedding_provider.hpp"

#include <utility>

namespace agentwatch::embedding {

EmbeddingBackend::EmbeddingBackend() : EmbeddingBackend(MakeHashingProviderFactory()) {}

EmbeddingBackend::EmbeddingBackend(ProviderFactory factory) : factory_(std::move(factory)) {}

bool EmbeddingBackend::Embed(std::string_view text, std::vector<float>& vector,
                             std::string& error) {
  std::shared_ptr<IEmbeddingProvider> provider;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (provider_ == nullptr) {
      if (!factory_) {
        error = "embedding backend has no provider factory";
        return false;
      }
      std::unique_ptr<IEmbeddingProvider> created = factory_(error);
      if (created == nullptr) {
        if (error.empty()) {
          error = "embedding provider factory returned no provider";
        }
        return false;
      }
      provider_ = std::move(created);
    }
    provider = provider_;
  }

  // The shared handle keeps the provider alive across a concurrent Reset().
  return provider->Embed(text, vector, error);
}

bool EmbeddingBackend::IsLoaded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return provider_ != nullptr;
}

void EmbeddingBackend::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  provider_.reset();
}

} // namespace agentwatch::embedding
