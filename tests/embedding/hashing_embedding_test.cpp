#include "embedding/embedding_backend.hpp"
#include "embedding/hashing_embedding_provider.hpp"
#include "embedding/vector_math.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

namespace embedding = agentwatch::embedding;

TEST_CASE("TokenizeWords lowercases alphanumeric runs", "[embedding]") {
  REQUIRE(embedding::TokenizeWords("Route-Planner: v2, OK!") ==
          std::vector<std::string>{"route", "planner", "v2", "ok"});
  REQUIRE(embedding::TokenizeWords("  ...  ").empty());
}

TEST_CASE("Hashing embeddings are deterministic unit vectors", "[embedding]") {
  embedding::HashingEmbeddingProvider provider(64);
  REQUIRE(provider.Name() == "hashing-64");

  std::vector<float> first;
  std::vector<float> second;
  std::string error;
  REQUIRE(provider.Embed("optimise delivery routes for the fleet", first, error));
  REQUIRE(provider.Embed("optimise delivery routes for the fleet", second, error));
  REQUIRE(first.size() == 64);
  REQUIRE(first == second);
  REQUIRE(embedding::CosineSimilarity(first, second) == Catch::Detail::Approx(1.0));

  std::vector<float> empty;
  REQUIRE(provider.Embed("!!!", empty, error));
  REQUIRE(empty.size() == 64);
  REQUIRE(embedding::CosineSimilarity(empty, first) == 0.0);
}

TEST_CASE("Related text scores higher than unrelated text", "[embedding]") {
  embedding::HashingEmbeddingProvider provider;
  std::vector<float> goal;
  std::vector<float> related;
  std::vector<float> unrelated;
  std::string error;
  REQUIRE(provider.Embed("optimise delivery routes for the truck fleet", goal, error));
  REQUIRE(provider.Embed("the optimised delivery routes reduce truck fleet mileage", related,
                         error));
  REQUIRE(provider.Embed("chocolate cake recipe with vanilla frosting", unrelated, error));

  REQUIRE(embedding::CosineSimilarity(goal, related) >
          embedding::CosineSimilarity(goal, unrelated));
}

TEST_CASE("CosineSimilarity handles degenerate inputs", "[embedding]") {
  REQUIRE(embedding::CosineSimilarity({}, {}) == 0.0);
  REQUIRE(embedding::CosineSimilarity({1.0F, 0.0F}, {1.0F}) == 0.0);
  REQUIRE(embedding::CosineSimilarity({0.0F, 0.0F}, {1.0F, 0.0F}) == 0.0);
  REQUIRE(embedding::CosineSimilarity({1.0F, 0.0F}, {0.0F, 2.0F}) == 0.0);
  REQUIRE(embedding::CosineSimilarity({1.0F, 1.0F}, {2.0F, 2.0F}) == Catch::Detail::Approx(1.0));
}

TEST_CASE("EmbeddingBackend constructs its provider once and retries failures",
          "[embedding]") {
  int constructions = 0;
  bool fail_next = true;
  embedding::EmbeddingBackend backend(
      [&constructions, &fail_next](std::string& error)
          -> std::unique_ptr<embedding::IEmbeddingProvider> {
        ++constructions;
        if (fail_next) {
          fail_next = false;
          error = "model files missing";
          return nullptr;
        }
        return std::make_unique<embedding::HashingEmbeddingProvider>(16);
      });
  REQUIRE_FALSE(backend.IsLoaded());

  std::vector<float> vector;
  std::string error;
  REQUIRE_FALSE(backend.Embed("first call", vector, error));
  REQUIRE(error == "model files missing");
  REQUIRE_FALSE(backend.IsLoaded());

  error.clear();
  REQUIRE(backend.Embed("second call", vector, error));
  REQUIRE(backend.Embed("third call", vector, error));
  REQUIRE(vector.size() == 16);
  REQUIRE(constructions == 2);
  REQUIRE(backend.IsLoaded());

  backend.Reset();
  REQUIRE_FALSE(backend.IsLoaded());
  REQUIRE(backend.Embed("after reset", vector, error));
  REQUIRE(constructions == 3);
}
