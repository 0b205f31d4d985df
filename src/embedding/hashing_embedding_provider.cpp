#include "embedding/hashing_embedding_provider.hpp"

#include "embedding/vector_math.hpp"

#include <cctype>
#include <cstdint>
#include <memory>
#include <utility>

namespace agentwatch::embedding {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

// Bigrams count for less than words so shared vocabulary dominates the score.
constexpr float kBigramWeight = 0.5F;

std::uint64_t Fnv1a(std::string_view text) {
  std::uint64_t hash = kFnvOffsetBasis;
  for (const char c : text) {
    hash ^= static_cast<unsigned char>(c);
    hash *= kFnvPrime;
  }
  return hash;
}

void AddFeature(std::string_view feature, const float weight, std::vector<float>& vector) {
  const std::uint64_t hash = Fnv1a(feature);
  const std::size_t bucket = static_cast<std::size_t>(hash % vector.size());
  // High bit picks the sign so unrelated features tend to cancel out.
  const float sign = ((hash >> 63U) & 1U) != 0U ? -1.0F : 1.0F;
  vector[bucket] += sign * weight;
}

} // namespace

std::vector<std::string> TokenizeWords(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  for (const char c : text) {
    const unsigned char byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) != 0) {
      current.push_back(static_cast<char>(std::tolower(byte)));
      continue;
    }
    if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

ProviderFactory MakeHashingProviderFactory(const std::size_t dimensions) {
  return [dimensions](std::string& /*error*/) -> std::unique_ptr<IEmbeddingProvider> {
    return std::make_unique<HashingEmbeddingProvider>(dimensions);
  };
}

HashingEmbeddingProvider::HashingEmbeddingProvider(const std::size_t dimensions)
    : dimensions_(dimensions) {}

std::string HashingEmbeddingProvider::Name() const {
  return "hashing-" + std::to_string(dimensions_);
}

bool HashingEmbeddingProvider::Embed(std::string_view text, std::vector<float>& vector,
                                     std::string& error) {
  if (dimensions_ == 0) {
    error = "hashing embedding requires at least one dimension";
    return false;
  }

  vector.assign(dimensions_, 0.0F);
  const std::vector<std::string> words = TokenizeWords(text);
  for (std::size_t i = 0; i < words.size(); ++i) {
    AddFeature(words[i], 1.0F, vector);
    if (i + 1 < words.size()) {
      AddFeature(words[i] + ' ' + words[i + 1], kBigramWeight, vector);
    }
  }

  NormalizeL2(vector);
  return true;
}

} // namespace agentwatch::embedding
