/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - multi-format config store, list getters and
 *        section enumeration.
 */

#include "xlink/config.hpp"
#include "xlink/dispatch_key.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>

namespace {

template <typename Cfg>
Cfg LoadText(const char* text, xlink::ConfigFormat format) {
  Cfg cfg;
  auto result =
      cfg.LoadBuffer(text, static_cast<uint32_t>(std::strlen(text)), format);
  REQUIRE(result.has_value());
  return cfg;
}

}  // namespace

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef XLINK_CONFIG_INI_ENABLED

using IniCfg = xlink::Config<xlink::IniBackend>;

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  auto cfg = LoadText<IniCfg>(
      "[router]\n"
      "default_capacity = 32\n"
      "[Exchange]\n"
      "endpoint1 = Pinger\n"
      "capacity = 8\n",
      xlink::ConfigFormat::kIni);

  REQUIRE(cfg.GetInt("router", "default_capacity", 0) == 32);
  REQUIRE(std::strcmp(cfg.GetString("Exchange", "endpoint1"), "Pinger") == 0);
  REQUIRE(cfg.GetInt("Exchange", "capacity", 0) == 8);
}

TEST_CASE("INI getter defaults", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(std::strcmp(cfg.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(cfg.GetInt("x", "y", 42) == 42);
  REQUIRE(cfg.GetBool("x", "y", true));
  REQUIRE_FALSE(cfg.FindInt("x", "y").has_value());
  REQUIRE_FALSE(cfg.FindUint32("x", "y").has_value());
}

TEST_CASE("INI GetBool spellings", "[config][ini]") {
  auto cfg = LoadText<IniCfg>(
      "[flags]\n"
      "a = true\n"
      "b = 1\n"
      "c = false\n"
      "d = yes\n"
      "e = on\n",
      xlink::ConfigFormat::kIni);

  REQUIRE(cfg.GetBool("flags", "a"));
  REQUIRE(cfg.GetBool("flags", "b"));
  REQUIRE_FALSE(cfg.GetBool("flags", "c"));
  REQUIRE(cfg.GetBool("flags", "d"));
  REQUIRE(cfg.GetBool("flags", "e"));
}

TEST_CASE("INI FindUint32 is strict", "[config][ini]") {
  auto cfg = LoadText<IniCfg>(
      "[cap]\n"
      "ok = 8\n"
      "suffix = 8x\n"
      "negative = -1\n"
      "huge = 4294967296\n"
      "max = 4294967295\n"
      "word = eight\n",
      xlink::ConfigFormat::kIni);

  REQUIRE(cfg.FindUint32("cap", "ok").value() == 8U);
  REQUIRE(cfg.FindUint32("cap", "max").value() == 4294967295U);
  REQUIRE_FALSE(cfg.FindUint32("cap", "suffix").has_value());
  REQUIRE_FALSE(cfg.FindUint32("cap", "negative").has_value());
  REQUIRE_FALSE(cfg.FindUint32("cap", "huge").has_value());
  REQUIRE_FALSE(cfg.FindUint32("cap", "word").has_value());
  // The lenient getter still reads the leading digits.
  REQUIRE(cfg.FindInt("cap", "suffix").value() == 8);
}

TEST_CASE("INI GetList splits and trims", "[config][ini]") {
  auto cfg = LoadText<IniCfg>(
      "[links]\n"
      "names = Exchange ,Monitor,, Telemetry \n"
      "single = Only\n"
      "blank =\n",
      xlink::ConfigFormat::kIni);

  xlink::NameString names[4];
  auto n = cfg.GetList("links", "names", names, 4);
  REQUIRE(n.has_value());
  REQUIRE(n.value() == 3U);
  REQUIRE(names[0] == "Exchange");
  REQUIRE(names[1] == "Monitor");
  REQUIRE(names[2] == "Telemetry");

  REQUIRE(cfg.GetList("links", "single", names, 4).value() == 1U);
  REQUIRE(names[0] == "Only");
  REQUIRE(cfg.GetList("links", "blank", names, 4).value() == 0U);
  REQUIRE(cfg.GetList("links", "missing", names, 4).value() == 0U);
}

TEST_CASE("INI GetList overflow", "[config][ini]") {
  auto cfg = LoadText<IniCfg>(
      "[links]\n"
      "names = A, B, C\n"
      "long = ThisNameIsDefinitelyLongerThanSixteen\n",
      xlink::ConfigFormat::kIni);

  xlink::NameString two[2];
  auto r = cfg.GetList("links", "names", two, 2);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == xlink::ConfigError::kBufferFull);

  xlink::FixedString<16> small[1];
  REQUIRE(cfg.GetList("links", "long", small, 1).get_error() ==
          xlink::ConfigError::kBufferFull);
}

TEST_CASE("INI Sections in first-seen order", "[config][ini]") {
  auto cfg = LoadText<IniCfg>(
      "[router]\nk = 1\n"
      "[Exchange]\nendpoint1 = A\n"
      "[Monitor]\nendpoint1 = B\n"
      "[exchange]\nendpoint2 = C\n",
      xlink::ConfigFormat::kIni);

  const char* sections[8];
  const uint32_t n = cfg.Sections(sections, 8);
  REQUIRE(n == 3U);  // section names compare case-insensitively
  REQUIRE(std::strcmp(sections[0], "router") == 0);
  REQUIRE(std::strcmp(sections[1], "Exchange") == 0);
  REQUIRE(std::strcmp(sections[2], "Monitor") == 0);

  REQUIRE(cfg.Sections(sections, 1) == 1U);
}

TEST_CASE("INI HasSection and HasKey", "[config][ini]") {
  auto cfg = LoadText<IniCfg>("[Exchange]\ncapacity = 8\n",
                              xlink::ConfigFormat::kIni);
  REQUIRE(cfg.HasSection("Exchange"));
  REQUIRE(cfg.HasSection("EXCHANGE"));
  REQUIRE_FALSE(cfg.HasSection("Monitor"));
  REQUIRE(cfg.HasKey("exchange", "Capacity"));
  REQUIRE_FALSE(cfg.HasKey("Exchange", "endpoint1"));
  REQUIRE(cfg.EntryCount() == 1U);
}

TEST_CASE("INI later load overrides earlier values", "[config][ini]") {
  IniCfg cfg;
  const char* first = "[Exchange]\ncapacity = 4\n";
  const char* second = "[Exchange]\ncapacity = 8\n";
  REQUIRE(cfg.LoadBuffer(first, static_cast<uint32_t>(std::strlen(first)),
                         xlink::ConfigFormat::kIni)
              .has_value());
  REQUIRE(cfg.LoadBuffer(second, static_cast<uint32_t>(std::strlen(second)),
                         xlink::ConfigFormat::kIni)
              .has_value());
  REQUIRE(cfg.FindUint32("Exchange", "capacity").value() == 8U);
  REQUIRE(cfg.EntryCount() == 1U);
}

TEST_CASE("INI unsupported format and missing file", "[config][ini]") {
  IniCfg cfg;
  auto wrong = cfg.LoadBuffer("{}", 2, xlink::ConfigFormat::kJson);
  REQUIRE(wrong.get_error() == xlink::ConfigError::kFormatNotSupported);

  auto missing = cfg.LoadFile("/tmp/__xlink_nonexistent__.ini");
  REQUIRE(missing.get_error() == xlink::ConfigError::kFileNotFound);
}

TEST_CASE("INI LoadFile from disk", "[config][ini]") {
  const char* path = "/tmp/__xlink_test_config__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[links]\nnames = Exchange\n[Exchange]\nendpoint1 = A\n");
  std::fclose(f);

  IniCfg cfg;
  auto result = cfg.LoadFile(path);
  std::remove(path);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("links", "names"), "Exchange") == 0);
  REQUIRE(std::strcmp(cfg.GetString("Exchange", "endpoint1"), "A") == 0);
}

#endif  // XLINK_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef XLINK_CONFIG_JSON_ENABLED

using JsonCfg = xlink::Config<xlink::JsonBackend>;

TEST_CASE("JSON LoadBuffer sections and scalars", "[config][json]") {
  auto cfg = LoadText<JsonCfg>(R"({
    "router": {"default_capacity": 32},
    "log": {"level": "warn"},
    "Exchange": {"endpoint1": "Pinger", "capacity": 8, "strict": true}
  })",
                               xlink::ConfigFormat::kJson);

  REQUIRE(cfg.FindUint32("router", "default_capacity").value() == 32U);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "warn") == 0);
  REQUIRE(std::strcmp(cfg.GetString("Exchange", "endpoint1"), "Pinger") == 0);
  REQUIRE(cfg.GetInt("Exchange", "capacity", 0) == 8);
  REQUIRE(cfg.GetBool("Exchange", "strict"));
}

TEST_CASE("JSON top-level keys go to the unnamed section", "[config][json]") {
  auto cfg = LoadText<JsonCfg>(R"({"name": "demo", "count": -3})",
                               xlink::ConfigFormat::kJson);
  REQUIRE(std::strcmp(cfg.GetString("", "name"), "demo") == 0);
  REQUIRE(cfg.GetInt("", "count", 0) == -3);
}

TEST_CASE("JSON arrays flatten to lists", "[config][json]") {
  auto cfg = LoadText<JsonCfg>(
      R"({"links": {"names": ["Exchange", "Monitor"], "sizes": [1, 2, 3]}})",
      xlink::ConfigFormat::kJson);

  REQUIRE(std::strcmp(cfg.GetString("links", "names"), "Exchange, Monitor") ==
          0);
  xlink::NameString names[4];
  REQUIRE(cfg.GetList("links", "names", names, 4).value() == 2U);
  REQUIRE(names[1] == "Monitor");
  REQUIRE(std::strcmp(cfg.GetString("links", "sizes"), "1, 2, 3") == 0);
}

TEST_CASE("JSON parse error", "[config][json]") {
  JsonCfg cfg;
  const char* bad = "{ \"links\": [ }";
  auto result = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                               xlink::ConfigFormat::kJson);
  REQUIRE(result.get_error() == xlink::ConfigError::kParseError);

  const char* not_object = "[1, 2]";
  result = cfg.LoadBuffer(not_object,
                          static_cast<uint32_t>(std::strlen(not_object)),
                          xlink::ConfigFormat::kJson);
  REQUIRE(result.get_error() == xlink::ConfigError::kParseError);
}

TEST_CASE("JSON LoadFile from disk", "[config][json]") {
  const char* path = "/tmp/__xlink_test_config__.json";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, R"({"Exchange": {"endpoint1": "A", "capacity": 4}})");
  std::fclose(f);

  JsonCfg cfg;
  auto result = cfg.LoadFile(path);
  std::remove(path);
  REQUIRE(result.has_value());
  REQUIRE(cfg.FindUint32("Exchange", "capacity").value() == 4U);
}

#endif  // XLINK_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef XLINK_CONFIG_YAML_ENABLED

using YamlCfg = xlink::Config<xlink::YamlBackend>;

TEST_CASE("YAML LoadBuffer sections and scalars", "[config][yaml]") {
  auto cfg = LoadText<YamlCfg>(
      "router:\n"
      "  default_capacity: 32\n"
      "Exchange:\n"
      "  endpoint1: Pinger\n"
      "  capacity: 8\n",
      xlink::ConfigFormat::kYaml);

  REQUIRE(cfg.FindUint32("router", "default_capacity").value() == 32U);
  REQUIRE(std::strcmp(cfg.GetString("Exchange", "endpoint1"), "Pinger") == 0);
  REQUIRE(cfg.GetInt("Exchange", "capacity", 0) == 8);
}

TEST_CASE("YAML sequences flatten to lists", "[config][yaml]") {
  auto cfg = LoadText<YamlCfg>(
      "links:\n"
      "  names: [Exchange, Monitor]\n",
      xlink::ConfigFormat::kYaml);

  xlink::NameString names[4];
  REQUIRE(cfg.GetList("links", "names", names, 4).value() == 2U);
  REQUIRE(names[0] == "Exchange");
  REQUIRE(names[1] == "Monitor");
}

TEST_CASE("YAML auto-detect extension yml", "[config][yaml]") {
  YamlCfg cfg;
  auto result = cfg.LoadFile("/tmp/__xlink_nonexistent__.yml");
  REQUIRE(result.get_error() == xlink::ConfigError::kFileNotFound);
}

#endif  // XLINK_CONFIG_YAML_ENABLED

// ============================================================================
// MultiConfig Tests (all enabled backends)
// ============================================================================

#if defined(XLINK_CONFIG_INI_ENABLED) && defined(XLINK_CONFIG_JSON_ENABLED)

TEST_CASE("MultiConfig dispatches on extension", "[config][multi]") {
  const char* ini_path = "/tmp/__xlink_multi__.ini";
  const char* json_path = "/tmp/__xlink_multi__.json";
  FILE* f = std::fopen(ini_path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[a]\nk = ini\n");
  std::fclose(f);
  f = std::fopen(json_path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, R"({"b": {"k": "json"}})");
  std::fclose(f);

  xlink::MultiConfig cfg;
  auto r1 = cfg.LoadFile(ini_path);
  auto r2 = cfg.LoadFile(json_path);
  std::remove(ini_path);
  std::remove(json_path);

  REQUIRE(r1.has_value());
  REQUIRE(r2.has_value());
  REQUIRE(std::strcmp(cfg.GetString("a", "k"), "ini") == 0);
  REQUIRE(std::strcmp(cfg.GetString("b", "k"), "json") == 0);
}

#endif
