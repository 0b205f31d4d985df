#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch.hpp>

#include <string>

using agentwatch::core::json::FindMember;
using agentwatch::core::json::MakeArray;
using agentwatch::core::json::MakeNumber;
using agentwatch::core::json::MakeObject;
using agentwatch::core::json::MakeString;
using agentwatch::core::json::Parse;
using agentwatch::core::json::Serialize;
using agentwatch::core::json::Value;

TEST_CASE("Serialize writes object members in key order", "[core][json]") {
  const Value value = MakeObject({
      {"zeta", MakeNumber(2)},
      {"alpha", MakeString("a\"b")},
      {"list", MakeArray({MakeNumber(1.5), MakeString("x")})},
  });
  REQUIRE(Serialize(value) == R"({"alpha":"a\"b","list":[1.5,"x"],"zeta":2})");
}

TEST_CASE("Parse reads nested documents", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"a": {"b": [true, null, -3.25]}, "s": "line\nbreak"})", root, error));
  REQUIRE(root.type == Value::Type::kObject);

  const Value* a = FindMember(root, "a");
  REQUIRE(a != nullptr);
  const Value* b = FindMember(*a, "b");
  REQUIRE(b != nullptr);
  REQUIRE(b->array_value.size() == 3);
  REQUIRE(b->array_value[0].bool_value);
  REQUIRE(b->array_value[1].type == Value::Type::kNull);
  REQUIRE(b->array_value[2].number_value == -3.25);

  const Value* s = FindMember(root, "s");
  REQUIRE(s != nullptr);
  REQUIRE(s->string_value == "line\nbreak");
}

TEST_CASE("Parse rejects malformed input with a position", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(Parse(R"({"a": )", root, error));
  REQUIRE(error.find("parse error") != std::string::npos);

  error.clear();
  REQUIRE_FALSE(Parse(R"({"a": 1} trailing)", root, error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("FindMember returns null for non-objects", "[core][json]") {
  REQUIRE(FindMember(MakeString("text"), "key") == nullptr);
  REQUIRE(FindMember(MakeObject(), "key") == nullptr);
}

TEST_CASE("WithThousands groups digits in threes", "[core][format]") {
  using agentwatch::core::WithThousands;
  REQUIRE(WithThousands(0) == "0");
  REQUIRE(WithThousands(999) == "999");
  REQUIRE(WithThousands(1000) == "1,000");
  REQUIRE(WithThousands(1234567) == "1,234,567");
  REQUIRE(WithThousands(-45000) == "-45,000");
}
