/**
 * @file router.hpp
 * @brief Typed message router: identity- and link-addressed dispatch over
 *        bounded pathways.
 *
 * Router<std::variant<A, B, ...>> owns the producer and consumer ends of
 * every registered pathway, type-erased behind SenderEndpoint / ClaimSlot.
 * Two addressing schemes share the same tables discipline:
 *
 *   Identity:  EndpointId -> sender            Send(id, msg)
 *              EndpointId -> claim slot         TakeReceiver<T>(id)
 *
 *   Link:      (link, type[, source]) -> key    Send(link, msg)
 *              key -> sender                    SendFrom(link, source, msg)
 *              key -> claim slot                TakeLinkReceiver<T>(link, ep)
 *
 * where key = "{link}/{source}_to_{target}" (see dispatch_key.hpp).
 *
 * Lifecycle: registration is single-threaded setup. After Seal() the router
 * is immutable except for claim slots and is meant to be shared as
 * std::shared_ptr<const Router<P>>; every const member is then safe to call
 * from any number of threads.
 *
 * Tables are fixed-capacity (XLINK_ROUTER_MAX_*); heap-allocate the router.
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef XLINK_ROUTER_HPP_
#define XLINK_ROUTER_HPP_

#include "xlink/dispatch_key.hpp"
#include "xlink/endpoint.hpp"
#include "xlink/log.hpp"
#include "xlink/message.hpp"
#include "xlink/pathway.hpp"
#include "xlink/platform.hpp"
#include "xlink/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <utility>
#include <variant>

#ifndef XLINK_ROUTER_MAX_SENDERS
#define XLINK_ROUTER_MAX_SENDERS 64U
#endif

#ifndef XLINK_ROUTER_MAX_RECEIVERS
#define XLINK_ROUTER_MAX_RECEIVERS 64U
#endif

#ifndef XLINK_ROUTER_MAX_ROUTES
#define XLINK_ROUTER_MAX_ROUTES 64U
#endif

namespace xlink {

struct EndpointIdTag {};
/// Plain-value endpoint identity; carries no type information.
using EndpointId = NewType<uint32_t, EndpointIdTag>;

template <typename PayloadVariant>
class Router final {
 public:
  using Payload = PayloadVariant;
  using Traits = PayloadTraits<Payload>;

  static constexpr uint32_t kMaxSenders = XLINK_ROUTER_MAX_SENDERS;
  static constexpr uint32_t kMaxReceivers = XLINK_ROUTER_MAX_RECEIVERS;
  static constexpr uint32_t kMaxRoutes = XLINK_ROUTER_MAX_ROUTES;

  Router() noexcept = default;
  ~Router() = default;

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(Router&&) = delete;

  // ==========================================================================
  // Registration: identity addressing
  // ==========================================================================

  template <typename T>
  expected<void, LinkError> RegisterSender(EndpointId id,
                                           PathwaySender<T> sender) noexcept {
    AssertAlternative<T>();
    if (XLINK_UNLIKELY(sealed_)) return Fail(LinkError::kRegistrySealed);
    if (FindSender(id) != nullptr) {
      XLINK_LOG_ERROR("Router", "sender %u already registered", id.value());
      return Fail(LinkError::kDuplicateRegistration);
    }
    if (senders_.full()) return Fail(LinkError::kRegistryFull);

    senders_.emplace_back(
        id, std::make_unique<TypedSenderEndpoint<Payload, T>>(std::move(sender)));
    XLINK_LOG_DEBUG("Router", "sender %u registered (%s)", id.value(),
                    MessageNameOf<T>());
    return expected<void, LinkError>::success();
  }

  template <typename T>
  expected<void, LinkError> RegisterReceiver(
      EndpointId id, PathwayReceiver<T> receiver) noexcept {
    AssertAlternative<T>();
    if (XLINK_UNLIKELY(sealed_)) return Fail(LinkError::kRegistrySealed);
    if (FindReceiver(id) != nullptr) {
      XLINK_LOG_ERROR("Router", "receiver %u already registered", id.value());
      return Fail(LinkError::kDuplicateRegistration);
    }
    if (receivers_.full()) return Fail(LinkError::kRegistryFull);

    receivers_.emplace_back(
        id, std::make_unique<TypedReceiverEndpoint<Payload, T>>(
                std::move(receiver)));
    XLINK_LOG_DEBUG("Router", "receiver %u registered (%s)", id.value(),
                    MessageNameOf<T>());
    return expected<void, LinkError>::success();
  }

  // ==========================================================================
  // Registration: link addressing
  // ==========================================================================

  /**
   * @brief Register the producer end of pathway @p source -> @p target on
   *        @p link. The link may carry T through this route only.
   * @return kInvalidName, kDuplicateRegistration (key reused),
   *         kAmbiguousDispatch (T already mapped on @p link).
   */
  template <typename T>
  expected<void, LinkError> RegisterPathway(const char* link,
                                            const char* source,
                                            const char* target,
                                            PathwaySender<T> sender) noexcept {
    return AddRoute<T>(link, source, target, std::move(sender), false);
  }

  /**
   * @brief Like RegisterPathway(), but the route is keyed by
   *        (link, source, T) so both directions of a link may carry T.
   *        Addressed with SendFrom().
   */
  template <typename T>
  expected<void, LinkError> RegisterDirectedPathway(
      const char* link, const char* source, const char* target,
      PathwaySender<T> sender) noexcept {
    return AddRoute<T>(link, source, target, std::move(sender), true);
  }

  /** @brief Register the consumer end of @p source -> @p target on @p link. */
  template <typename T>
  expected<void, LinkError> RegisterPathwayReceiver(
      const char* link, const char* source, const char* target,
      PathwayReceiver<T> receiver) noexcept {
    AssertAlternative<T>();
    constexpr size_t kTag = VariantIndex<T, Payload>::value;
    if (XLINK_UNLIKELY(sealed_)) return Fail(LinkError::kRegistrySealed);
    auto key = MakeDispatchKey(link, source, target);
    if (!key.has_value()) {
      XLINK_LOG_ERROR("Router", "invalid pathway name %s/%s->%s",
                      Printable(link), Printable(source), Printable(target));
      return Fail(key.get_error());
    }
    if (FindLinkReceiver(key.value()) != nullptr) {
      XLINK_LOG_ERROR("Router", "receiver %s already registered",
                      key.value().c_str());
      return Fail(LinkError::kDuplicateRegistration);
    }
    const PathwayEntry* pathway = FindPathway(key.value());
    if (pathway != nullptr && pathway->endpoint->TypeTag() != kTag) {
      XLINK_LOG_ERROR("Router", "%s carries %s, receiver of %s rejected",
                      key.value().c_str(), pathway->endpoint->TypeName(),
                      MessageNameOf<T>());
      return Fail(LinkError::kTypeMismatch);
    }
    // TakeLinkReceiver() resolves by (link, target, T); a second match would
    // never be claimable.
    for (const auto& entry : link_receivers_) {
      if (entry.link == link && entry.target == target &&
          entry.slot.TypeTag() == kTag) {
        XLINK_LOG_ERROR("Router", "%s already delivers %s to %s (via %s)",
                        link, MessageNameOf<T>(), target, entry.key.c_str());
        return Fail(LinkError::kAmbiguousDispatch);
      }
    }
    if (link_receivers_.full()) return Fail(LinkError::kRegistryFull);

    link_receivers_.emplace_back(
        key.value(), link, target,
        std::make_unique<TypedReceiverEndpoint<Payload, T>>(std::move(receiver)));
    XLINK_LOG_DEBUG("Router", "receiver %s registered (%s)", key.value().c_str(),
                    MessageNameOf<T>());
    return expected<void, LinkError>::success();
  }

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /** @brief End the setup phase. Later registrations fail kRegistrySealed. */
  void Seal() noexcept {
    sealed_ = true;
    XLINK_LOG_INFO("Router",
                   "sealed: %u senders, %u receivers, %u routes, %u link "
                   "receivers",
                   senders_.size(), receivers_.size(), routes_.size(),
                   link_receivers_.size());
  }

  bool IsSealed() const noexcept { return sealed_; }

  /**
   * @brief Check that every identity in @p ids holds a sender or receiver.
   * @return kPathwayNotFound for the first unknown identity.
   */
  expected<void, LinkError> Validate(const EndpointId* ids,
                                     uint32_t count) const noexcept {
    for (uint32_t i = 0; i < count; ++i) {
      if (FindSender(ids[i]) == nullptr && FindReceiver(ids[i]) == nullptr) {
        XLINK_LOG_ERROR("Router", "endpoint %u is not registered",
                        ids[i].value());
        return Fail(LinkError::kPathwayNotFound);
      }
    }
    return expected<void, LinkError>::success();
  }

  /**
   * @brief Check that every link pathway has both ends: a sender for each
   *        registered receiver and a receiver for each registered sender.
   * @return kPathwayNotFound naming the first half-registered key.
   */
  expected<void, LinkError> ValidateLinks() const noexcept {
    for (const auto& entry : pathways_) {
      if (FindLinkReceiver(entry.key) == nullptr) {
        XLINK_LOG_ERROR("Router", "pathway %s has no receiver",
                        entry.key.c_str());
        return Fail(LinkError::kPathwayNotFound);
      }
    }
    for (const auto& entry : link_receivers_) {
      if (FindPathway(entry.key) == nullptr) {
        XLINK_LOG_ERROR("Router", "receiver %s has no sender",
                        entry.key.c_str());
        return Fail(LinkError::kPathwayNotFound);
      }
    }
    return expected<void, LinkError>::success();
  }

  // ==========================================================================
  // Send: identity addressing
  // ==========================================================================

  /** @brief Blocking send to the sender registered under @p id. */
  template <typename T>
  expected<void, LinkError> Send(EndpointId id, T msg) const noexcept {
    return SendToId(id, std::move(msg), SendMode::kBlocking, 0U);
  }

  /** @brief Non-blocking send; kQueueFull if the pathway is full. */
  template <typename T>
  expected<void, LinkError> TrySend(EndpointId id, T msg) const noexcept {
    return SendToId(id, std::move(msg), SendMode::kTry, 0U);
  }

  template <typename T>
  expected<void, LinkError> SendFor(EndpointId id, T msg,
                                    uint64_t timeout_us) const noexcept {
    return SendToId(id, std::move(msg), SendMode::kTimed, timeout_us);
  }

  // ==========================================================================
  // Send: link addressing
  // ==========================================================================

  /**
   * @brief Blocking send over the undirected route carrying T on @p link.
   * @return kLinkNotFound, kMessageTypeNotMapped, or kAmbiguousDispatch when
   *         T only travels over directed routes (use SendFrom()).
   */
  template <typename T>
  expected<void, LinkError> Send(const char* link, T msg) const noexcept {
    return SendOnLink(link, nullptr, std::move(msg), SendMode::kBlocking, 0U);
  }

  template <typename T>
  expected<void, LinkError> TrySend(const char* link, T msg) const noexcept {
    return SendOnLink(link, nullptr, std::move(msg), SendMode::kTry, 0U);
  }

  template <typename T>
  expected<void, LinkError> SendFor(const char* link, T msg,
                                    uint64_t timeout_us) const noexcept {
    return SendOnLink(link, nullptr, std::move(msg), SendMode::kTimed,
                      timeout_us);
  }

  /** @brief Blocking send over the route carrying T from @p source. */
  template <typename T>
  expected<void, LinkError> SendFrom(const char* link, const char* source,
                                     T msg) const noexcept {
    return SendOnLink(link, source, std::move(msg), SendMode::kBlocking, 0U);
  }

  template <typename T>
  expected<void, LinkError> TrySendFrom(const char* link, const char* source,
                                        T msg) const noexcept {
    return SendOnLink(link, source, std::move(msg), SendMode::kTry, 0U);
  }

  // ==========================================================================
  // Claim
  // ==========================================================================

  /**
   * @brief Take the consumer registered under @p id. Succeeds at most once.
   * @return kPathwayNotFound, kTypeMismatch, kAlreadyClaimed.
   */
  template <typename T>
  expected<PathwayReceiver<T>, LinkError> TakeReceiver(
      EndpointId id) const noexcept {
    AssertAlternative<T>();
    const ReceiverEntry* entry = FindReceiver(id);
    if (entry == nullptr) {
      return expected<PathwayReceiver<T>, LinkError>::error(
          LinkError::kPathwayNotFound);
    }
    auto result = entry->slot.template Take<T>();
    LogClaim(result, entry->slot, MessageNameOf<T>());
    if (result.has_value()) {
      XLINK_LOG_DEBUG("Router", "receiver %u claimed", id.value());
    }
    return result;
  }

  /**
   * @brief Take the consumer of the pathway on @p link that delivers T to
   *        @p endpoint.
   * @return kLinkNotFound, kPathwayNotFound, kTypeMismatch, kAlreadyClaimed.
   */
  template <typename T>
  expected<PathwayReceiver<T>, LinkError> TakeLinkReceiver(
      const char* link, const char* endpoint) const noexcept {
    AssertAlternative<T>();
    constexpr size_t kTag = VariantIndex<T, Payload>::value;
    bool link_known = false;
    const LinkReceiverEntry* other_type = nullptr;
    for (const auto& entry : link_receivers_) {
      if (entry.link != link) continue;
      link_known = true;
      if (entry.target != endpoint) continue;
      if (entry.slot.TypeTag() == kTag) {
        auto result = entry.slot.template Take<T>();
        LogClaim(result, entry.slot, MessageNameOf<T>());
        if (result.has_value()) {
          XLINK_LOG_DEBUG("Router", "receiver %s claimed", entry.key.c_str());
        }
        return result;
      }
      other_type = &entry;
    }
    if (!link_known) {
      return expected<PathwayReceiver<T>, LinkError>::error(
          LinkError::kLinkNotFound);
    }
    if (other_type != nullptr) {
      XLINK_LOG_ERROR("Router", "%s carries %s, not %s", other_type->key.c_str(),
                      other_type->slot.TypeName(), MessageNameOf<T>());
      return expected<PathwayReceiver<T>, LinkError>::error(
          LinkError::kTypeMismatch);
    }
    return expected<PathwayReceiver<T>, LinkError>::error(
        LinkError::kPathwayNotFound);
  }

  /**
   * @brief Claim and destroy the consumer under @p id; its pathway closes
   *        and later sends fail kSendFailed.
   */
  expected<void, LinkError> DiscardReceiver(EndpointId id) const noexcept {
    const ReceiverEntry* entry = FindReceiver(id);
    if (entry == nullptr) return Fail(LinkError::kPathwayNotFound);
    auto result = entry->slot.Discard();
    if (result.has_value()) {
      XLINK_LOG_DEBUG("Router", "receiver %u discarded", id.value());
    }
    return result;
  }

  // ==========================================================================
  // Diagnostics
  // ==========================================================================

  uint32_t SenderCount() const noexcept { return senders_.size(); }
  uint32_t ReceiverCount() const noexcept {
    return receivers_.size() + link_receivers_.size();
  }
  uint32_t RouteCount() const noexcept { return routes_.size(); }

  /** @brief True if the receiver under @p id was taken or discarded. */
  bool IsClaimed(EndpointId id) const noexcept {
    const ReceiverEntry* entry = FindReceiver(id);
    return entry != nullptr && entry->slot.IsClaimed();
  }

  /** @brief Message name carried by the sender under @p id, or nullptr. */
  const char* SenderTypeName(EndpointId id) const noexcept {
    const SenderEntry* entry = FindSender(id);
    return (entry != nullptr) ? entry->endpoint->TypeName() : nullptr;
  }

 private:
  struct SenderEntry {
    SenderEntry(EndpointId i, std::unique_ptr<SenderEndpoint<Payload>> ep) noexcept
        : id(i), endpoint(std::move(ep)) {}
    EndpointId id;
    std::unique_ptr<SenderEndpoint<Payload>> endpoint;
  };

  struct ReceiverEntry {
    ReceiverEntry(EndpointId i,
                  std::unique_ptr<ReceiverEndpoint<Payload>> ep) noexcept
        : id(i), slot(std::move(ep)) {}
    EndpointId id;
    ClaimSlot<Payload> slot;
  };

  /// (link, type[, source]) -> dispatch key.
  struct RouteEntry {
    NameString link;
    NameString source;
    size_t type_tag;
    bool directed;
    DispatchKey key;
  };

  /// dispatch key -> producer end.
  struct PathwayEntry {
    PathwayEntry(const DispatchKey& k,
                 std::unique_ptr<SenderEndpoint<Payload>> ep) noexcept
        : key(k), endpoint(std::move(ep)) {}
    DispatchKey key;
    std::unique_ptr<SenderEndpoint<Payload>> endpoint;
  };

  /// dispatch key -> consumer end.
  struct LinkReceiverEntry {
    LinkReceiverEntry(const DispatchKey& k, const char* l, const char* t,
                      std::unique_ptr<ReceiverEndpoint<Payload>> ep) noexcept
        : key(k),
          link(TruncateToCapacity, l),
          target(TruncateToCapacity, t),
          slot(std::move(ep)) {}
    DispatchKey key;
    NameString link;
    NameString target;
    ClaimSlot<Payload> slot;
  };

  template <typename T>
  static void AssertAlternative() noexcept {
    static_assert(IsPayloadAlternative<T, Payload>::value,
                  "message type is not an alternative of the router payload");
  }

  static expected<void, LinkError> Fail(LinkError err) noexcept {
    return expected<void, LinkError>::error(err);
  }

  static const char* Printable(const char* s) noexcept {
    return (s != nullptr) ? s : "(null)";
  }

  template <typename T>
  static void LogClaim(const expected<PathwayReceiver<T>, LinkError>& result,
                       const ClaimSlot<Payload>& slot,
                       const char* requested) noexcept {
    if (!result.has_value() && result.get_error() == LinkError::kTypeMismatch) {
      XLINK_LOG_ERROR("Router", "claim as %s, receiver carries %s", requested,
                      slot.TypeName());
    }
  }

  const SenderEntry* FindSender(EndpointId id) const noexcept {
    for (const auto& entry : senders_) {
      if (entry.id == id) return &entry;
    }
    return nullptr;
  }

  const ReceiverEntry* FindReceiver(EndpointId id) const noexcept {
    for (const auto& entry : receivers_) {
      if (entry.id == id) return &entry;
    }
    return nullptr;
  }

  const PathwayEntry* FindPathway(const DispatchKey& key) const noexcept {
    for (const auto& entry : pathways_) {
      if (entry.key == key) return &entry;
    }
    return nullptr;
  }

  const LinkReceiverEntry* FindLinkReceiver(const DispatchKey& key) const noexcept {
    for (const auto& entry : link_receivers_) {
      if (entry.key == key) return &entry;
    }
    return nullptr;
  }

  template <typename T>
  expected<void, LinkError> AddRoute(const char* link, const char* source,
                                     const char* target, PathwaySender<T>&& sender,
                                     bool directed) noexcept {
    AssertAlternative<T>();
    constexpr size_t kTag = VariantIndex<T, Payload>::value;
    if (XLINK_UNLIKELY(sealed_)) return Fail(LinkError::kRegistrySealed);

    auto key = MakeDispatchKey(link, source, target);
    if (!key.has_value()) {
      XLINK_LOG_ERROR("Router", "invalid pathway name %s/%s->%s",
                      Printable(link), Printable(source), Printable(target));
      return Fail(key.get_error());
    }
    if (FindPathway(key.value()) != nullptr) {
      XLINK_LOG_ERROR("Router", "pathway %s already registered",
                      key.value().c_str());
      return Fail(LinkError::kDuplicateRegistration);
    }
    const LinkReceiverEntry* receiver = FindLinkReceiver(key.value());
    if (receiver != nullptr && receiver->slot.TypeTag() != kTag) {
      XLINK_LOG_ERROR("Router", "%s delivers %s, sender of %s rejected",
                      key.value().c_str(), receiver->slot.TypeName(),
                      MessageNameOf<T>());
      return Fail(LinkError::kTypeMismatch);
    }
    for (const auto& route : routes_) {
      if (route.link != link || route.type_tag != kTag) continue;
      // An undirected route owns (link, T) outright; directed routes only
      // collide with each other on the same source.
      if (!route.directed || !directed || route.source == source) {
        XLINK_LOG_ERROR("Router", "%s already mapped on link %s (via %s)",
                        MessageNameOf<T>(), link, route.key.c_str());
        return Fail(LinkError::kAmbiguousDispatch);
      }
    }
    if (pathways_.full() || routes_.full()) {
      return Fail(LinkError::kRegistryFull);
    }

    pathways_.emplace_back(
        key.value(),
        std::make_unique<TypedSenderEndpoint<Payload, T>>(std::move(sender)));
    RouteEntry route{NameString(TruncateToCapacity, link),
                     NameString(TruncateToCapacity, source), kTag, directed,
                     key.value()};
    routes_.push_back(route);
    XLINK_LOG_DEBUG("Router", "pathway %s registered (%s%s)",
                    key.value().c_str(), MessageNameOf<T>(),
                    directed ? ", directed" : "");
    return expected<void, LinkError>::success();
  }

  /// Type check and forward; common tail of both addressing schemes.
  expected<void, LinkError> Forward(const SenderEndpoint<Payload>& endpoint,
                                    Payload&& payload, SendMode mode,
                                    uint64_t timeout_us,
                                    const char* where) const noexcept {
    if (endpoint.TypeTag() != payload.index()) {
      XLINK_LOG_ERROR("Router", "%s carries %s, send of %s rejected", where,
                      endpoint.TypeName(), Traits::NameAt(payload.index()));
      return Fail(LinkError::kTypeMismatch);
    }
    auto result = endpoint.Send(std::move(payload), mode, timeout_us);
    if (!result.has_value() && result.get_error() == LinkError::kSendFailed) {
      XLINK_LOG_WARN("Router", "%s: receiver closed", where);
    }
    return result;
  }

  template <typename T>
  expected<void, LinkError> SendToId(EndpointId id, T&& msg, SendMode mode,
                                     uint64_t timeout_us) const noexcept {
    AssertAlternative<T>();
    const SenderEntry* entry = FindSender(id);
    if (entry == nullptr) {
      XLINK_LOG_WARN("Router", "no sender under endpoint %u", id.value());
      return Fail(LinkError::kPathwayNotFound);
    }
    char where[24];
    (void)std::snprintf(where, sizeof(where), "endpoint %u", id.value());
    return Forward(*entry->endpoint,
                   Payload(std::in_place_type<T>, std::move(msg)), mode,
                   timeout_us, where);
  }

  /// @p source == nullptr selects the undirected route for (link, T).
  template <typename T>
  expected<void, LinkError> SendOnLink(const char* link, const char* source,
                                       T&& msg, SendMode mode,
                                       uint64_t timeout_us) const noexcept {
    AssertAlternative<T>();
    constexpr size_t kTag = VariantIndex<T, Payload>::value;
    bool link_known = false;
    bool directed_only = false;
    const RouteEntry* match = nullptr;
    for (const auto& route : routes_) {
      if (route.link != link) continue;
      link_known = true;
      if (route.type_tag != kTag) continue;
      if (source == nullptr) {
        if (route.directed) {
          directed_only = true;
          continue;
        }
      } else if (route.source != source) {
        continue;
      }
      match = &route;
      break;
    }
    if (match == nullptr) {
      if (!link_known) {
        XLINK_LOG_WARN("Router", "link %s not found", Printable(link));
        return Fail(LinkError::kLinkNotFound);
      }
      if (directed_only) {
        XLINK_LOG_ERROR("Router", "%s on link %s needs a source endpoint",
                        MessageNameOf<T>(), link);
        return Fail(LinkError::kAmbiguousDispatch);
      }
      XLINK_LOG_WARN("Router", "link %s does not carry %s", link,
                     MessageNameOf<T>());
      return Fail(LinkError::kMessageTypeNotMapped);
    }
    const PathwayEntry* pathway = FindPathway(match->key);
    if (XLINK_UNLIKELY(pathway == nullptr)) {
      XLINK_LOG_ERROR("Router", "route %s has no pathway", match->key.c_str());
      return Fail(LinkError::kPathwayNotFound);
    }
    return Forward(*pathway->endpoint,
                   Payload(std::in_place_type<T>, std::move(msg)), mode,
                   timeout_us, match->key.c_str());
  }

  FixedVector<SenderEntry, kMaxSenders> senders_;
  FixedVector<ReceiverEntry, kMaxReceivers> receivers_;
  FixedVector<RouteEntry, kMaxRoutes> routes_;
  FixedVector<PathwayEntry, kMaxRoutes> pathways_;
  FixedVector<LinkReceiverEntry, kMaxRoutes> link_receivers_;
  bool sealed_{false};
};

}  // namespace xlink

#endif  // XLINK_ROUTER_HPP_
