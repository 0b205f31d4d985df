#pragma once

#include "embedding/embedding_backend.hpp"
#include "embedding/embedding_provider.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace agentwatch::embedding {

// Deterministic local embedding: lowercased alphanumeric words and adjacent
// word bigrams are hashed (FNV-1a) into a signed bag of `dimensions` buckets,
// then L2-normalized. Text without any word yields the zero vector.
class HashingEmbeddingProvider final : public IEmbeddingProvider {
public:
  static constexpr std::size_t kDefaultDimensions = 384;

  explicit HashingEmbeddingProvider(std::size_t dimensions = kDefaultDimensions);

  std::string Name() const override;
  bool Embed(std::string_view text, std::vector<float>& vector, std::string& error) override;

private:
  std::size_t dimensions_;
};

// Factory for EmbeddingBackend producing a HashingEmbeddingProvider.
ProviderFactory MakeHashingProviderFactory(
    std::size_t dimensions = HashingEmbeddingProvider::kDefaultDimensions);

// Splits text into lowercased runs of ASCII letters and digits.
std::vector<std::string> TokenizeWords(std::string_view text);

} // namespace agentwatch::embedding
