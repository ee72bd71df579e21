/**
 * @file endpoint.hpp
 * @brief Type-erased pathway endpoints and the one-shot receiver claim slot.
 *
 * The router stores senders and receivers of many message types in uniform
 * tables. SenderEndpoint<Payload> hides PathwaySender<T> behind a virtual
 * interface that accepts the payload variant; ReceiverEndpoint<Payload>
 * hides PathwayReceiver<T> until its owner claims it with the right T.
 *
 * Both carry the variant index of T as their type tag, so a mismatch is
 * detected by comparing integers before any downcast (no RTTI).
 */

#ifndef XLINK_ENDPOINT_HPP_
#define XLINK_ENDPOINT_HPP_

#include "xlink/log.hpp"
#include "xlink/message.hpp"
#include "xlink/pathway.hpp"
#include "xlink/platform.hpp"
#include "xlink/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>
#include <variant>

namespace xlink {

// ============================================================================
// Sender side
// ============================================================================

/** @brief Blocking behaviour of one send. */
enum class SendMode : uint8_t { kBlocking = 0, kTry, kTimed };

template <typename Payload>
class SenderEndpoint {
 public:
  virtual ~SenderEndpoint() = default;

  /**
   * @brief Forward the alternative held by @p msg into the pathway.
   * @param timeout_us Only used with SendMode::kTimed.
   */
  virtual expected<void, LinkError> Send(Payload&& msg, SendMode mode,
                                         uint64_t timeout_us) const noexcept = 0;

  virtual size_t TypeTag() const noexcept = 0;
  virtual const char* TypeName() const noexcept = 0;
  virtual bool IsClosed() const noexcept = 0;
};

template <typename Payload, typename T>
class TypedSenderEndpoint final : public SenderEndpoint<Payload> {
 public:
  static constexpr size_t kTag = VariantIndex<T, Payload>::value;
  static_assert(kTag != static_cast<size_t>(-1),
                "T must be an alternative of the router payload variant");

  explicit TypedSenderEndpoint(PathwaySender<T>&& sender) noexcept
      : sender_(std::move(sender)) {}

  expected<void, LinkError> Send(Payload&& msg, SendMode mode,
                                 uint64_t timeout_us) const noexcept override {
    T* concrete = std::get_if<T>(&msg);
    if (XLINK_UNLIKELY(concrete == nullptr)) {
      XLINK_LOG_ERROR("Endpoint",
                      "payload holds alternative %u, endpoint carries %s",
                      static_cast<unsigned>(msg.index()), TypeName());
      return expected<void, LinkError>::error(
          LinkError::kInternalInconsistency);
    }
    switch (mode) {
      case SendMode::kTry:
        return sender_.TrySend(std::move(*concrete));
      case SendMode::kTimed:
        return sender_.SendFor(std::move(*concrete), timeout_us);
      case SendMode::kBlocking:
      default:
        return sender_.Send(std::move(*concrete));
    }
  }

  size_t TypeTag() const noexcept override { return kTag; }
  const char* TypeName() const noexcept override { return MessageNameOf<T>(); }
  bool IsClosed() const noexcept override { return sender_.IsClosed(); }

 private:
  PathwaySender<T> sender_;
};

// ============================================================================
// Receiver side
// ============================================================================

template <typename Payload>
class ReceiverEndpoint {
 public:
  virtual ~ReceiverEndpoint() = default;
  virtual size_t TypeTag() const noexcept = 0;
  virtual const char* TypeName() const noexcept = 0;
};

template <typename Payload, typename T>
class TypedReceiverEndpoint final : public ReceiverEndpoint<Payload> {
 public:
  static constexpr size_t kTag = VariantIndex<T, Payload>::value;
  static_assert(kTag != static_cast<size_t>(-1),
                "T must be an alternative of the router payload variant");

  explicit TypedReceiverEndpoint(PathwayReceiver<T>&& receiver) noexcept
      : receiver_(std::move(receiver)) {}

  size_t TypeTag() const noexcept override { return kTag; }
  const char* TypeName() const noexcept override { return MessageNameOf<T>(); }

  PathwayReceiver<T> Release() noexcept { return std::move(receiver_); }

 private:
  PathwayReceiver<T> receiver_;
};

// ============================================================================
// ClaimSlot
// ============================================================================

/**
 * @brief Holds one receiver endpoint until it is taken, at most once.
 *
 * Take<T>() is safe to call concurrently from any number of threads: the
 * type check happens first and does not consume the slot; among callers
 * with the right T exactly one wins the CAS and every other gets
 * kAlreadyClaimed.
 */
template <typename Payload>
class ClaimSlot final {
 public:
  explicit ClaimSlot(std::unique_ptr<ReceiverEndpoint<Payload>> endpoint) noexcept
      : type_tag_(endpoint->TypeTag()),
        type_name_(endpoint->TypeName()),
        endpoint_(std::move(endpoint)) {}

  ClaimSlot(const ClaimSlot&) = delete;
  ClaimSlot& operator=(const ClaimSlot&) = delete;

  template <typename T>
  expected<PathwayReceiver<T>, LinkError> Take() const noexcept {
    if (type_tag_ != VariantIndex<T, Payload>::value) {
      return expected<PathwayReceiver<T>, LinkError>::error(
          LinkError::kTypeMismatch);
    }
    bool unclaimed = false;
    if (!claimed_.compare_exchange_strong(unclaimed, true,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
      return expected<PathwayReceiver<T>, LinkError>::error(
          LinkError::kAlreadyClaimed);
    }
    std::unique_ptr<ReceiverEndpoint<Payload>> taken = std::move(endpoint_);
    if (XLINK_UNLIKELY(taken == nullptr || taken->TypeTag() != type_tag_)) {
      XLINK_LOG_ERROR("Endpoint", "claim slot for %s lost its endpoint",
                      type_name_);
      return expected<PathwayReceiver<T>, LinkError>::error(
          LinkError::kInternalInconsistency);
    }
    auto* typed = static_cast<TypedReceiverEndpoint<Payload, T>*>(taken.get());
    return expected<PathwayReceiver<T>, LinkError>::success(typed->Release());
  }

  /**
   * @brief Claim the slot without a type and drop the receiver, closing its
   *        pathway so senders observe kSendFailed.
   */
  expected<void, LinkError> Discard() const noexcept {
    bool unclaimed = false;
    if (!claimed_.compare_exchange_strong(unclaimed, true,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
      return expected<void, LinkError>::error(LinkError::kAlreadyClaimed);
    }
    endpoint_.reset();
    return expected<void, LinkError>::success();
  }

  bool IsClaimed() const noexcept {
    return claimed_.load(std::memory_order_acquire);
  }

  size_t TypeTag() const noexcept { return type_tag_; }
  const char* TypeName() const noexcept { return type_name_; }

 private:
  const size_t type_tag_;
  const char* const type_name_;
  alignas(kCacheLineSize) mutable std::atomic<bool> claimed_{false};
  mutable std::unique_ptr<ReceiverEndpoint<Payload>> endpoint_;
};

}  // namespace xlink

#endif  // XLINK_ENDPOINT_HPP_
