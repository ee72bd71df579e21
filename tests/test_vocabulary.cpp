/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "xlink/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstring>
#include <memory>
#include <string>

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = xlink::expected<uint32_t, xlink::LinkError>::success(42U);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42U);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = xlink::expected<uint32_t, xlink::LinkError>::error(
      xlink::LinkError::kLinkNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == xlink::LinkError::kLinkNotFound);
  REQUIRE(r.value_or(7U) == 7U);
}

TEST_CASE("expected void specialization is assignable",
          "[vocabulary][expected]") {
  auto r = xlink::expected<void, xlink::LinkError>::success();
  REQUIRE(r.has_value());

  r = xlink::expected<void, xlink::LinkError>::error(
      xlink::LinkError::kQueueFull);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == xlink::LinkError::kQueueFull);
}

TEST_CASE("expected holds a move-only value", "[vocabulary][expected]") {
  using Result = xlink::expected<std::unique_ptr<int>, xlink::LinkError>;
  auto r = Result::success(std::make_unique<int>(5));
  REQUIRE(*r.value() == 5);

  Result moved(std::move(r));
  REQUIRE(*moved.value() == 5);

  std::unique_ptr<int> out = std::move(moved).value();
  REQUIRE(*out == 5);
}

// ============================================================================
// optional<T> tests
// ============================================================================

TEST_CASE("optional empty and engaged", "[vocabulary][optional]") {
  xlink::optional<int> empty;
  REQUIRE(!empty.has_value());
  REQUIRE(empty.value_or(99) == 99);

  xlink::optional<int> full(10);
  REQUIRE(full.has_value());
  REQUIRE(*full == 10);
  full.reset();
  REQUIRE(!full.has_value());
}

TEST_CASE("optional emplace and arrow", "[vocabulary][optional]") {
  struct Point {
    int x;
    int y;
  };
  xlink::optional<Point> p;
  p.emplace(Point{1, 2});
  REQUIRE(p->x == 1);
  REQUIRE(p->y == 2);
}

TEST_CASE("optional copy/move", "[vocabulary][optional]") {
  xlink::optional<std::string> o1(std::string("pathway"));
  xlink::optional<std::string> o2 = o1;
  REQUIRE(o2.value() == "pathway");

  xlink::optional<std::string> o3 = std::move(o1);
  REQUIRE(o3.value() == "pathway");
}

// ============================================================================
// FixedString tests
// ============================================================================

TEST_CASE("FixedString from literal", "[vocabulary][fixed_string]") {
  xlink::FixedString<32> s("Exchange");
  REQUIRE(s.size() == 8U);
  REQUIRE(s == "Exchange");
  REQUIRE(s != "exchange");
}

TEST_CASE("FixedString truncation", "[vocabulary][fixed_string]") {
  xlink::FixedString<5> s(xlink::TruncateToCapacity, "hello world");
  REQUIRE(s.size() == 5U);
  REQUIRE(s == "hello");

  xlink::FixedString<8> part(xlink::TruncateToCapacity, "abcdef", 3U);
  REQUIRE(part == "abc");

  s.assign(xlink::TruncateToCapacity, nullptr);
  REQUIRE(s.empty());
}

TEST_CASE("FixedString append respects capacity", "[vocabulary][fixed_string]") {
  xlink::FixedString<8> s("Link");
  REQUIRE(s.append("/A"));
  REQUIRE(s == "Link/A");
  REQUIRE(!s.append("_to_B"));
  REQUIRE(s == "Link/A");
  REQUIRE(s.append("_B"));
  REQUIRE(s.size() == 8U);
}

TEST_CASE("FixedString equality across capacities",
          "[vocabulary][fixed_string]") {
  xlink::FixedString<8> s1("abc");
  xlink::FixedString<32> s2("abc");
  xlink::FixedString<32> s3("abd");
  REQUIRE(s1 == s2);
  REQUIRE(s1 != s3);
}

// ============================================================================
// FixedVector tests
// ============================================================================

TEST_CASE("FixedVector push/pop and full boundary",
          "[vocabulary][fixed_vector]") {
  xlink::FixedVector<int, 2> v;
  REQUIRE(v.empty());
  REQUIRE(v.push_back(10));
  REQUIRE(v.push_back(20));
  REQUIRE(v.full());
  REQUIRE(!v.push_back(30));
  REQUIRE(v.pop_back());
  REQUIRE(v.size() == 1U);
  REQUIRE(v[0] == 10);
}

TEST_CASE("FixedVector erase_unordered", "[vocabulary][fixed_vector]") {
  xlink::FixedVector<int, 8> v;
  v.push_back(1);
  v.push_back(2);
  v.push_back(3);

  REQUIRE(v.erase_unordered(0));
  REQUIRE(v.size() == 2U);
  REQUIRE(v[0] == 3);
  REQUIRE(v[1] == 2);
  REQUIRE(!v.erase_unordered(5));
}

TEST_CASE("FixedVector holds non-movable elements",
          "[vocabulary][fixed_vector]") {
  struct Slot {
    explicit Slot(int v) : value(v) {}
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    int value;
    std::atomic<bool> taken{false};
  };

  xlink::FixedVector<Slot, 4> v;
  REQUIRE(v.emplace_back(1));
  REQUIRE(v.emplace_back(2));
  int sum = 0;
  for (const auto& s : v) sum += s.value;
  REQUIRE(sum == 3);
  v[1].taken.store(true);
  REQUIRE(v[1].taken.load());
  v.clear();
  REQUIRE(v.empty());
}

TEST_CASE("FixedVector copy and move", "[vocabulary][fixed_vector]") {
  xlink::FixedVector<std::string, 4> v1;
  v1.push_back(std::string("a"));
  v1.emplace_back("b");

  xlink::FixedVector<std::string, 4> v2 = v1;
  REQUIRE(v2.size() == 2U);
  REQUIRE(v2[1] == "b");

  xlink::FixedVector<std::string, 4> v3 = std::move(v1);
  REQUIRE(v3.size() == 2U);
  REQUIRE(v1.empty());
}

// ============================================================================
// NewType tests
// ============================================================================

namespace {
struct PortTag {};
struct NodeTag {};
using PortId = xlink::NewType<uint32_t, PortTag>;
using NodeId = xlink::NewType<uint32_t, NodeTag>;
}  // namespace

TEST_CASE("NewType compares within its own tag", "[vocabulary][newtype]") {
  constexpr PortId a{1};
  constexpr PortId b{2};
  static_assert(!std::is_convertible<PortId, NodeId>::value,
                "distinct tags must not convert");
  static_assert(!std::is_convertible<uint32_t, PortId>::value,
                "construction is explicit");
  REQUIRE(a.value() == 1U);
  REQUIRE(a != b);
  REQUIRE(a < b);
  REQUIRE(PortId{} == PortId{0});
}

// ============================================================================
// and_then / or_else tests
// ============================================================================

TEST_CASE("and_then on success and error", "[vocabulary][functional]") {
  using Result = xlink::expected<uint32_t, xlink::ConfigError>;
  auto twice = [](uint32_t v) { return Result::success(v * 2U); };

  REQUIRE(xlink::and_then(Result::success(10U), twice).value() == 20U);

  auto err = xlink::and_then(Result::error(xlink::ConfigError::kParseError),
                             twice);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == xlink::ConfigError::kParseError);
}

TEST_CASE("or_else runs only on error", "[vocabulary][functional]") {
  using Result = xlink::expected<uint32_t, xlink::ConfigError>;
  xlink::ConfigError captured = xlink::ConfigError::kFileNotFound;
  bool called = false;

  xlink::or_else(Result::error(xlink::ConfigError::kMissingKey),
                 [&](xlink::ConfigError e) {
                   captured = e;
                   called = true;
                 });
  REQUIRE(called);
  REQUIRE(captured == xlink::ConfigError::kMissingKey);

  called = false;
  xlink::or_else(Result::success(1U),
                 [&](xlink::ConfigError) { called = true; });
  REQUIRE(!called);
}

// ============================================================================
// LinkErrorToString
// ============================================================================

TEST_CASE("LinkErrorToString names every error", "[vocabulary][errors]") {
  REQUIRE(std::strcmp(xlink::LinkErrorToString(
                          xlink::LinkError::kDuplicateRegistration),
                      "DuplicateRegistration") == 0);
  REQUIRE(std::strcmp(xlink::LinkErrorToString(xlink::LinkError::kTimeout),
                      "Timeout") == 0);
  REQUIRE(std::strcmp(xlink::LinkErrorToString(
                          xlink::LinkError::kInternalInconsistency),
                      "InternalInconsistency") == 0);
  REQUIRE(std::strcmp(xlink::LinkErrorToString(
                          static_cast<xlink::LinkError>(200)),
                      "Unknown") == 0);
}
