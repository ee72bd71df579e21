/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all xlink modules.
 *
 * Provides:
 *   - expected<V, E>     : value-or-error result (no exceptions)
 *   - optional<T>        : nullable value without heap allocation
 *   - FixedString<N>     : bounded, null-terminated string
 *   - FixedVector<T, N>  : bounded vector with inline storage
 *   - NewType<T, Tag>    : strong typedef
 *   - and_then / or_else : expected combinators
 *   - ConfigError, LinkError
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef XLINK_VOCABULARY_HPP_
#define XLINK_VOCABULARY_HPP_

#include "xlink/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace xlink {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kMissingKey,
  kInvalidValue
};

/// Errors reported by pathways and the router.
enum class LinkError : uint8_t {
  kDuplicateRegistration = 0,  ///< Identity or dispatch key registered twice.
  kAmbiguousDispatch,          ///< (link, type) maps to more than one route.
  kPathwayNotFound,            ///< No endpoint under the identity / key.
  kLinkNotFound,               ///< Link name has no routes.
  kMessageTypeNotMapped,       ///< Link exists but does not carry the type.
  kTypeMismatch,               ///< Stored type tag differs from the request.
  kAlreadyClaimed,             ///< Receiver already taken.
  kSendFailed,                 ///< Consumer side dropped or closed.
  kChannelClosed,              ///< Producer side gone and buffer drained.
  kQueueFull,                  ///< Non-blocking send on a full pathway.
  kEmpty,                      ///< Non-blocking receive on an empty pathway.
  kTimeout,                    ///< Timed operation expired.
  kInvalidCapacity,            ///< Pathway capacity of zero.
  kInvalidName,                ///< Name empty, too long or not injective.
  kRegistryFull,               ///< Compile-time table capacity exhausted.
  kRegistrySealed,             ///< Registration after Seal().
  kInternalInconsistency       ///< Erasure invariant broken after checks.
};

inline const char* LinkErrorToString(LinkError err) noexcept {
  switch (err) {
    case LinkError::kDuplicateRegistration: return "DuplicateRegistration";
    case LinkError::kAmbiguousDispatch:     return "AmbiguousDispatch";
    case LinkError::kPathwayNotFound:       return "PathwayNotFound";
    case LinkError::kLinkNotFound:          return "LinkNotFound";
    case LinkError::kMessageTypeNotMapped:  return "MessageTypeNotMapped";
    case LinkError::kTypeMismatch:          return "TypeMismatch";
    case LinkError::kAlreadyClaimed:        return "AlreadyClaimed";
    case LinkError::kSendFailed:            return "SendFailed";
    case LinkError::kChannelClosed:         return "ChannelClosed";
    case LinkError::kQueueFull:             return "QueueFull";
    case LinkError::kEmpty:                 return "Empty";
    case LinkError::kTimeout:               return "Timeout";
    case LinkError::kInvalidCapacity:       return "InvalidCapacity";
    case LinkError::kInvalidName:           return "InvalidName";
    case LinkError::kRegistryFull:          return "RegistryFull";
    case LinkError::kRegistrySealed:        return "RegistrySealed";
    case LinkError::kInternalInconsistency: return "InternalInconsistency";
  }
  return "Unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through success() / error(). value() on an error result
 * is a precondition violation (XLINK_ASSERT in debug builds).
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected r(ErrorState{}, E{});
    r.Construct(val);
    return r;
  }

  static expected success(V&& val) noexcept {
    expected r(ErrorState{}, E{});
    r.Construct(std::move(val));
    return r;
  }

  static expected error(E err) noexcept { return expected(ErrorState{}, err); }

  expected(const expected& other) noexcept
      : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      Construct(*other.Ptr());
    }
  }

  expected(expected&& other) noexcept : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      Construct(std::move(*other.Ptr()));
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        Construct(*other.Ptr());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        Construct(std::move(*other.Ptr()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    XLINK_ASSERT(has_value_);
    return *Ptr();
  }

  const V& value() const& noexcept {
    XLINK_ASSERT(has_value_);
    return *Ptr();
  }

  V&& value() && noexcept {
    XLINK_ASSERT(has_value_);
    return std::move(*Ptr());
  }

  E get_error() const noexcept {
    XLINK_ASSERT(!has_value_);
    return err_;
  }

  template <typename U>
  V value_or(U&& default_val) const& noexcept {
    return has_value_ ? *Ptr() : static_cast<V>(std::forward<U>(default_val));
  }

 private:
  struct ErrorState {};

  expected(ErrorState, E err) noexcept : err_(err), has_value_(false) {}

  template <typename U>
  void Construct(U&& val) noexcept {
    ::new (static_cast<void*>(&storage_)) V(std::forward<U>(val));
    has_value_ = true;
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }

  V* Ptr() noexcept { return std::launder(reinterpret_cast<V*>(&storage_)); }
  const V* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const V*>(&storage_));
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E err_;
  bool has_value_;
};

/// @brief Specialization for operations that return no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    XLINK_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E err) noexcept : err_(err), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// and_then / or_else
// ============================================================================

/// Invoke @p fn with the value on success, otherwise propagate the error.
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Result = decltype(fn(r.value()));
  if (r.has_value()) {
    return fn(r.value());
  }
  return Result::error(r.get_error());
}

/// Invoke @p fn with the error on failure. Returns @p r unchanged.
template <typename V, typename E, typename F>
const expected<V, E>& or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
  return r;
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) noexcept : has_value_(false) { Construct(val); }
  optional(T&& val) noexcept : has_value_(false) { Construct(std::move(val)); }

  optional(const optional& other) noexcept : has_value_(false) {
    if (other.has_value_) {
      Construct(*other.Ptr());
    }
  }

  optional(optional&& other) noexcept : has_value_(false) {
    if (other.has_value_) {
      Construct(std::move(*other.Ptr()));
    }
  }

  optional& operator=(const optional& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        Construct(*other.Ptr());
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        Construct(std::move(*other.Ptr()));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & noexcept {
    XLINK_ASSERT(has_value_);
    return *Ptr();
  }

  const T& value() const& noexcept {
    XLINK_ASSERT(has_value_);
    return *Ptr();
  }

  T&& value() && noexcept {
    XLINK_ASSERT(has_value_);
    return std::move(*Ptr());
  }

  T& operator*() noexcept { return value(); }
  const T& operator*() const noexcept { return value(); }
  T* operator->() noexcept { return &value(); }
  const T* operator->() const noexcept { return &value(); }

  template <typename U>
  T value_or(U&& default_val) const& noexcept {
    return has_value_ ? *Ptr() : static_cast<T>(std::forward<U>(default_val));
  }

  template <typename... Args>
  T& emplace(Args&&... args) noexcept {
    reset();
    Construct(std::forward<Args>(args)...);
    return *Ptr();
  }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  template <typename... Args>
  void Construct(Args&&... args) noexcept {
    ::new (static_cast<void*>(&storage_)) T(std::forward<Args>(args)...);
    has_value_ = true;
  }

  T* Ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  const T* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of Capacity characters.
 *
 * Construction from a literal is checked at compile time; construction from
 * a runtime pointer must state TruncateToCapacity explicitly.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <size_t N>
  FixedString(const char (&str)[N]) noexcept : size_(0) {
    static_assert(N - 1 <= Capacity, "String literal exceeds FixedString capacity");
    Copy(str, static_cast<uint32_t>(N - 1));
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t count) noexcept
      : size_(0) {
    Copy(str, count < Capacity ? count : Capacity);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    uint32_t len = 0;
    while (len < Capacity && str[len] != '\0') {
      ++len;
    }
    Copy(str, len);
  }

  /// @brief Append @p str; returns false (and leaves the string unchanged)
  ///        if the result would not fit.
  bool append(const char* str) noexcept {
    if (str == nullptr) return true;
    const size_t len = std::strlen(str);
    if (len > static_cast<size_t>(Capacity - size_)) {
      return false;
    }
    std::memcpy(&buf_[size_], str, len);
    size_ += static_cast<uint32_t>(len);
    buf_[size_] = '\0';
    return true;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }
  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  void Copy(const char* src, uint32_t len) noexcept {
    std::memcpy(buf_, src, len);
    buf_[len] = '\0';
    size_ = len;
  }

  char buf_[Capacity + 1];
  uint32_t size_;
};

// ============================================================================
// FixedVector<T, Capacity>
// ============================================================================

/**
 * @brief Vector with inline storage and a compile-time upper bound.
 *
 * push_back / emplace_back return false when full instead of allocating.
 * Elements are never relocated except by erase_unordered and by moving the
 * whole vector, so a non-movable T is usable as long as neither is called.
 */
template <typename T, uint32_t Capacity>
class FixedVector final {
 public:
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept : size_(0) {}

  FixedVector(const FixedVector& other) noexcept : size_(0) {
    for (uint32_t i = 0; i < other.size_; ++i) {
      static_cast<void>(emplace_back(other[i]));
    }
  }

  FixedVector(FixedVector&& other) noexcept : size_(0) {
    for (uint32_t i = 0; i < other.size_; ++i) {
      static_cast<void>(emplace_back(std::move(other[i])));
    }
    other.clear();
  }

  FixedVector& operator=(const FixedVector& other) noexcept {
    if (this != &other) {
      clear();
      for (uint32_t i = 0; i < other.size_; ++i) {
        static_cast<void>(emplace_back(other[i]));
      }
    }
    return *this;
  }

  FixedVector& operator=(FixedVector&& other) noexcept {
    if (this != &other) {
      clear();
      for (uint32_t i = 0; i < other.size_; ++i) {
        static_cast<void>(emplace_back(std::move(other[i])));
      }
      other.clear();
    }
    return *this;
  }

  ~FixedVector() { clear(); }

  bool push_back(const T& val) noexcept { return emplace_back(val); }
  bool push_back(T&& val) noexcept { return emplace_back(std::move(val)); }

  template <typename... Args>
  bool emplace_back(Args&&... args) noexcept {
    if (size_ >= Capacity) return false;
    ::new (static_cast<void*>(&storage_[size_])) T(std::forward<Args>(args)...);
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0) return false;
    --size_;
    At(size_)->~T();
    return true;
  }

  /// Remove element @p index by moving the last element into its place.
  bool erase_unordered(uint32_t index) noexcept {
    if (index >= size_) return false;
    if (index != size_ - 1U) {
      *At(index) = std::move(*At(size_ - 1U));
    }
    return pop_back();
  }

  void clear() noexcept {
    while (size_ > 0) {
      static_cast<void>(pop_back());
    }
  }

  T& operator[](uint32_t i) noexcept {
    XLINK_ASSERT(i < size_);
    return *At(i);
  }

  const T& operator[](uint32_t i) const noexcept {
    XLINK_ASSERT(i < size_);
    return *At(i);
  }

  iterator begin() noexcept { return At(0); }
  iterator end() noexcept { return At(0) + size_; }
  const_iterator begin() const noexcept { return At(0); }
  const_iterator end() const noexcept { return At(0) + size_; }

  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0; }
  bool full() const noexcept { return size_ >= Capacity; }

 private:
  T* At(uint32_t i) noexcept {
    return std::launder(reinterpret_cast<T*>(&storage_[i]));
  }
  const T* At(uint32_t i) const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_[i]));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_[Capacity];
  uint32_t size_;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: two NewTypes over the same T with different tags
 *        do not convert into each other.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : val_() {}
  constexpr explicit NewType(T val) noexcept : val_(val) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& rhs) const noexcept {
    return val_ == rhs.val_;
  }
  constexpr bool operator!=(const NewType& rhs) const noexcept {
    return val_ != rhs.val_;
  }
  constexpr bool operator<(const NewType& rhs) const noexcept {
    return val_ < rhs.val_;
  }

 private:
  T val_;
};

}  // namespace xlink

#endif  // XLINK_VOCABULARY_HPP_
