#include <catch2/catch_test_macros.hpp>
#include <string>

#include <railpath/format_repair.hpp>

using namespace railpath;

TEST_CASE("Repair: byte-order mark is stripped") {
  RepairReport r{};
  const std::string out = repair_level_text("\xEF\xBB\xBF{\"a\": 1}", &r);
  REQUIRE(out == "{\"a\": 1}");
  REQUIRE(r.bom_stripped);
  REQUIRE(r.total() == 1);
}

TEST_CASE("Repair: trailing commas before closers are removed") {
  RepairReport r{};
  const std::string out = repair_level_text("{\"a\": [1, 2, ], \"b\": {\"c\": 3,\n  },\n}", &r);
  REQUIRE(out == "{\"a\": [1, 2 ], \"b\": {\"c\": 3\n  }\n}");
  REQUIRE(r.trailing_commas == 3);
}

TEST_CASE("Repair: raw newline before a literal escape collapses") {
  RepairReport r{};
  const std::string out = repair_level_text("\"line\n\\nnext\"", &r);
  REQUIRE(out == "\"line\\nnext\"");
  REQUIRE(r.escape_newlines == 1);
}

TEST_CASE("Repair: missing comma before decorations is inserted") {
  RepairReport r{};
  const std::string out = repair_level_text("{\"actions\": []\n  \"decorations\": []}", &r);
  REQUIRE(out == "{\"actions\": []\n  ,\"decorations\": []}");
  REQUIRE(r.decoration_commas == 1);

  // Already separated, or first key: untouched.
  REQUIRE(repair_level_text("{\"a\": 1,\n \"decorations\": []}") == "{\"a\": 1,\n \"decorations\": []}");
  REQUIRE(repair_level_text("{ \"decorations\": []}") == "{ \"decorations\": []}");
  // Not whitespace-preceded: untouched.
  REQUIRE(repair_level_text("[1]\"decorations\"") == "[1]\"decorations\"");
}

TEST_CASE("Repair: doubled commas collapse once, not iteratively") {
  RepairReport r{};
  REQUIRE(repair_level_text("[1,,2]", &r) == "[1,2]");
  REQUIRE(r.doubled_commas == 1);
  REQUIRE(repair_level_text("[1,,,2]") == "[1,,2]");
}

TEST_CASE("Repair: clean text passes through unchanged") {
  const std::string clean = "{\"pathData\": \"RRR\", \"settings\": {\"bpm\": 100}}";
  RepairReport r{};
  REQUIRE(repair_level_text(clean, &r) == clean);
  REQUIRE(r.total() == 0);
}
