/**
 * @file message.hpp
 * @brief Compile-time message type identity for variant payloads.
 *
 * A router is parameterized on a closed std::variant<...> of message types.
 * The variant index of T is its type tag; MessageName<T> gives it a stable
 * human-readable name for diagnostics and config files (no RTTI needed).
 *
 * Usage (at global scope):
 * @code
 *   struct Ping { uint32_t seq; };
 *   XLINK_MESSAGE_NAME(Ping, "Ping")
 *   using Payload = std::variant<Ping, Pong>;
 *   static_assert(xlink::VariantIndex<Ping, Payload>::value == 0, "");
 * @endcode
 */

#ifndef XLINK_MESSAGE_HPP_
#define XLINK_MESSAGE_HPP_

#include "xlink/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <utility>
#include <variant>

namespace xlink {

// ============================================================================
// VariantIndex
// ============================================================================

namespace detail {

template <typename T, size_t I, typename Variant>
struct VariantIndexImpl;

template <typename T, size_t I>
struct VariantIndexImpl<T, I, std::variant<>> {
  static constexpr size_t value = static_cast<size_t>(-1);
};

template <typename T, size_t I, typename First, typename... Rest>
struct VariantIndexImpl<T, I, std::variant<First, Rest...>> {
  static constexpr size_t value =
      std::is_same<T, First>::value
          ? I
          : VariantIndexImpl<T, I + 1, std::variant<Rest...>>::value;
};

}  // namespace detail

/** @brief Index of T in Variant, or size_t(-1) if T is not an alternative. */
template <typename T, typename Variant>
struct VariantIndex;

template <typename T, typename... Types>
struct VariantIndex<T, std::variant<Types...>> {
  static constexpr size_t value =
      detail::VariantIndexImpl<T, 0, std::variant<Types...>>::value;
};

template <typename T, typename Variant>
struct IsPayloadAlternative
    : std::integral_constant<bool, VariantIndex<T, Variant>::value !=
                                       static_cast<size_t>(-1)> {};

// ============================================================================
// MessageName
// ============================================================================

/** @brief Human-readable message name. Specialize via XLINK_MESSAGE_NAME. */
template <typename T>
struct MessageName {
  static constexpr const char* value = nullptr;
};

template <typename T>
constexpr const char* MessageNameOf() noexcept {
  return (MessageName<T>::value != nullptr) ? MessageName<T>::value
                                            : "<unnamed>";
}

// ============================================================================
// PayloadTraits
// ============================================================================

/**
 * @brief Runtime view of the alternatives of a payload variant: type tag to
 *        name and name to type tag.
 */
template <typename Variant>
struct PayloadTraits;

template <typename... Types>
struct PayloadTraits<std::variant<Types...>> {
  static constexpr size_t kAlternatives = sizeof...(Types);
  static constexpr size_t kNotFound = static_cast<size_t>(-1);

  static const char* NameAt(size_t tag) noexcept {
    static constexpr const char* kNames[] = {MessageNameOf<Types>()...};
    return (tag < kAlternatives) ? kNames[tag] : "<invalid>";
  }

  /** @brief Tag of the alternative registered under @p name, or kNotFound. */
  static size_t FindByName(const char* name) noexcept {
    if (name == nullptr) return kNotFound;
    for (size_t i = 0; i < kAlternatives; ++i) {
      if (std::strcmp(NameAt(i), name) == 0) return i;
    }
    return kNotFound;
  }
};

}  // namespace xlink

/// Bind a stable name to a message type. Use at global scope.
#define XLINK_MESSAGE_NAME(Type, Name)                 \
  namespace xlink {                                    \
  template <>                                          \
  struct MessageName<Type> {                           \
    static constexpr const char* value = Name;         \
  };                                                   \
  }

#endif  // XLINK_MESSAGE_HPP_
