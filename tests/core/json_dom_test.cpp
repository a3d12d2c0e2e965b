#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <string>

using recsync::core::json::Value;

TEST_CASE("Parser keeps integers apart from floating point numbers", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(recsync::core::json::Parse(R"({"index": 3, "delay": 0.86, "big": 1e3})", root, error));

  const Value* index = recsync::core::json::FindMember(root, "index");
  REQUIRE(index != nullptr);
  REQUIRE(index->is_integer());
  REQUIRE(index->integer_value == 3);

  const Value* delay = recsync::core::json::FindMember(root, "delay");
  REQUIRE(delay != nullptr);
  REQUIRE(delay->type == Value::Type::kNumber);
  REQUIRE(delay->AsDouble() == 0.86);

  const Value* big = recsync::core::json::FindMember(root, "big");
  REQUIRE(big != nullptr);
  REQUIRE_FALSE(big->is_integer());
  REQUIRE(big->AsDouble() == 1000.0);
}

TEST_CASE("Parser decodes escapes and surrogate pairs to UTF-8", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(recsync::core::json::Parse(R"(["a\"b\\c\n", "\u00e9", "\ud83c\udfa4"])", root, error));
  REQUIRE(root.is_array());
  REQUIRE(root.array_value.size() == 3U);
  REQUIRE(root.array_value[0].string_value == "a\"b\\c\n");
  REQUIRE(root.array_value[1].string_value == "\xC3\xA9");
  REQUIRE(root.array_value[2].string_value == "\xF0\x9F\x8E\xA4");
}

TEST_CASE("Parser rejects malformed documents with a diagnostic", "[core][json]") {
  Value root;
  std::string error;

  REQUIRE_FALSE(recsync::core::json::Parse(R"({"a": 1,})", root, error));
  REQUIRE_FALSE(error.empty());

  error.clear();
  REQUIRE_FALSE(recsync::core::json::Parse(R"({"a": 1} trailing)", root, error));
  REQUIRE(error.find("trailing") != std::string::npos);

  error.clear();
  REQUIRE_FALSE(recsync::core::json::Parse(std::string(100, '['), root, error));
  REQUIRE(error.find("deep") != std::string::npos);
}

TEST_CASE("ToJsonText writes compact and indented forms", "[core][json]") {
  const Value object = recsync::core::json::MakeObject({
      {"name", recsync::core::json::MakeString("left \"cam\"")},
      {"count", recsync::core::json::MakeInteger(2)},
      {"delay", recsync::core::json::MakeNumber(1.0)},
      {"files", recsync::core::json::MakeArray({recsync::core::json::MakeString("a.mkv")})},
      {"empty", recsync::core::json::MakeObject()},
  });

  REQUIRE(recsync::core::ToJsonText(object) ==
          R"({"count":2,"delay":1.0,"empty":{},"files":["a.mkv"],"name":"left \"cam\""})");

  const std::string pretty = recsync::core::ToJsonText(object, 2);
  REQUIRE(pretty.find("{\n  \"count\": 2,\n") == 0U);
  REQUIRE(pretty.find("\"files\": [\n    \"a.mkv\"\n  ]") != std::string::npos);
  REQUIRE(pretty.back() == '}');
}

TEST_CASE("Serialized DOM parses back to an equal value", "[core][json]") {
  const Value original = recsync::core::json::MakeObject({
      {"device_count", recsync::core::json::MakeInteger(4)},
      {"notes", recsync::core::json::MakeString("tab\there")},
      {"ok", recsync::core::json::MakeBool(true)},
      {"none", Value{}},
  });

  Value reparsed;
  std::string error;
  REQUIRE(recsync::core::json::Parse(recsync::core::ToJsonText(original, 2), reparsed, error));
  REQUIRE(reparsed == original);
}

TEST_CASE("Non-finite doubles are written as null", "[core][json]") {
  REQUIRE(recsync::core::FormatJsonDouble(0.5) == "0.5");
  REQUIRE(recsync::core::FormatJsonDouble(3.0) == "3.0");
  REQUIRE(recsync::core::FormatJsonDouble(std::numeric_limits<double>::infinity()) == "null");
}
