/**
 * @file link_builder.hpp
 * @brief Declarative link topology: LinkSpec values wired into a Router.
 *
 * A link joins two named endpoints. Each endpoint may send one payload
 * alternative (named by XLINK_MESSAGE_NAME) to its peer; an empty `sends`
 * leaves that direction out, which makes the link unidirectional.
 *
 *   LinkSpec{"PingPongLink", {"Pinger", "Ping"}, {"Ponger", "Pong"}, 8}
 *
 *     Pinger --Ping--> [PingPongLink/Pinger_to_Ponger] --> Ponger
 *     Pinger <--Pong-- [PingPongLink/Ponger_to_Pinger] <-- Ponger
 *
 * When both endpoints send the same type the two routes are registered as
 * directed routes and must be addressed with Router::SendFrom().
 */

#ifndef XLINK_LINK_BUILDER_HPP_
#define XLINK_LINK_BUILDER_HPP_

#include "xlink/dispatch_key.hpp"
#include "xlink/log.hpp"
#include "xlink/message.hpp"
#include "xlink/pathway.hpp"
#include "xlink/router.hpp"
#include "xlink/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <utility>
#include <variant>

#ifndef XLINK_MAX_LINKS
#define XLINK_MAX_LINKS 16U
#endif

namespace xlink {

static constexpr uint32_t kDefaultLinkCapacity = 16U;

struct EndpointSpec {
  NameString name;
  NameString sends;  ///< Message name this endpoint emits; empty for none.
};

struct LinkSpec {
  NameString name;
  EndpointSpec endpoint1;
  EndpointSpec endpoint2;
  uint32_t capacity{kDefaultLinkCapacity};
};

namespace detail {

template <typename Payload, size_t I>
expected<void, LinkError> WireDirection(Router<Payload>& router,
                                        const char* link, const char* source,
                                        const char* target, uint32_t capacity,
                                        bool directed) noexcept {
  using T = std::variant_alternative_t<I, Payload>;
  auto pair = CreatePathway<T>(capacity);
  if (!pair.has_value()) {
    return expected<void, LinkError>::error(pair.get_error());
  }
  PathwayPair<T>& ends = pair.value();
  auto sent = directed
                  ? router.RegisterDirectedPathway(link, source, target,
                                                   std::move(ends.sender))
                  : router.RegisterPathway(link, source, target,
                                           std::move(ends.sender));
  if (!sent.has_value()) return sent;
  return router.RegisterPathwayReceiver(link, source, target,
                                        std::move(ends.receiver));
}

template <typename Payload, size_t... Is>
expected<void, LinkError> WireByTag(size_t tag, Router<Payload>& router,
                                    const char* link, const char* source,
                                    const char* target, uint32_t capacity,
                                    bool directed,
                                    std::index_sequence<Is...>) noexcept {
  using WireFn = expected<void, LinkError> (*)(Router<Payload>&, const char*,
                                               const char*, const char*,
                                               uint32_t, bool) noexcept;
  static constexpr WireFn kTable[] = {&WireDirection<Payload, Is>...};
  return kTable[tag](router, link, source, target, capacity, directed);
}

}  // namespace detail

/**
 * @brief Register both directions of one link.
 * @return kInvalidName for an empty link/endpoint name or an unknown message
 *         name, kInvalidCapacity, or the first registration error.
 */
template <typename Payload>
expected<void, LinkError> BuildLink(Router<Payload>& router,
                                    const LinkSpec& spec) noexcept {
  using Traits = PayloadTraits<Payload>;
  if (spec.name.empty() || spec.endpoint1.name.empty() ||
      spec.endpoint2.name.empty()) {
    XLINK_LOG_ERROR("LinkBuilder", "link '%s' has an unnamed part",
                    spec.name.c_str());
    return expected<void, LinkError>::error(LinkError::kInvalidName);
  }
  if (spec.capacity == 0U || spec.capacity > kMaxPathwayCapacity) {
    XLINK_LOG_ERROR("LinkBuilder", "link %s: capacity %u outside 1..%u",
                    spec.name.c_str(), spec.capacity, kMaxPathwayCapacity);
    return expected<void, LinkError>::error(LinkError::kInvalidCapacity);
  }

  const EndpointSpec* ends[2] = {&spec.endpoint1, &spec.endpoint2};
  size_t tags[2] = {Traits::kNotFound, Traits::kNotFound};
  for (uint32_t i = 0; i < 2U; ++i) {
    if (ends[i]->sends.empty()) continue;
    tags[i] = Traits::FindByName(ends[i]->sends.c_str());
    if (tags[i] == Traits::kNotFound) {
      XLINK_LOG_ERROR("LinkBuilder", "link %s: unknown message type '%s'",
                      spec.name.c_str(), ends[i]->sends.c_str());
      return expected<void, LinkError>::error(LinkError::kInvalidName);
    }
  }

  const bool directed = tags[0] != Traits::kNotFound && tags[0] == tags[1];
  for (uint32_t i = 0; i < 2U; ++i) {
    if (tags[i] == Traits::kNotFound) continue;
    const EndpointSpec& from = *ends[i];
    const EndpointSpec& to = *ends[1U - i];
    auto r = detail::WireByTag<Payload>(
        tags[i], router, spec.name.c_str(), from.name.c_str(),
        to.name.c_str(), spec.capacity, directed,
        std::make_index_sequence<Traits::kAlternatives>{});
    if (!r.has_value()) {
      XLINK_LOG_ERROR("LinkBuilder", "link %s: %s -> %s failed: %s",
                      spec.name.c_str(), from.name.c_str(), to.name.c_str(),
                      LinkErrorToString(r.get_error()));
      return r;
    }
  }
  XLINK_LOG_INFO("LinkBuilder", "link %s: %s <-> %s (capacity %u)",
                 spec.name.c_str(), spec.endpoint1.name.c_str(),
                 spec.endpoint2.name.c_str(), spec.capacity);
  return expected<void, LinkError>::success();
}

/** @brief BuildLink() for each spec in order; stops at the first error. */
template <typename Payload>
expected<void, LinkError> BuildLinks(Router<Payload>& router,
                                     const LinkSpec* specs,
                                     uint32_t count) noexcept {
  for (uint32_t i = 0; i < count; ++i) {
    auto r = BuildLink(router, specs[i]);
    if (!r.has_value()) return r;
  }
  return expected<void, LinkError>::success();
}

/**
 * @brief Build a sealed router from @p specs, ready to be shared between
 *        endpoint threads.
 */
template <typename Payload>
expected<std::shared_ptr<const Router<Payload>>, LinkError> MakeRouter(
    const LinkSpec* specs, uint32_t count) noexcept {
  using Result = expected<std::shared_ptr<const Router<Payload>>, LinkError>;
  auto router = std::make_shared<Router<Payload>>();
  auto r = BuildLinks(*router, specs, count);
  if (!r.has_value()) {
    return Result::error(r.get_error());
  }
  r = router->ValidateLinks();
  if (!r.has_value()) {
    return Result::error(r.get_error());
  }
  router->Seal();
  return Result::success(std::shared_ptr<const Router<Payload>>(std::move(router)));
}

/**
 * @brief One endpoint's view of a link on a shared router.
 *
 * Sends go out as SendFrom(link, name) so they work on links where both
 * endpoints send the same type; TakeReceiver() claims the pathway that
 * delivers T to this endpoint.
 */
template <typename Payload>
class LinkEndpoint {
 public:
  LinkEndpoint(std::shared_ptr<const Router<Payload>> router, const char* link,
               const char* name) noexcept
      : router_(std::move(router)),
        link_(TruncateToCapacity, link),
        name_(TruncateToCapacity, name) {}

  template <typename T>
  expected<void, LinkError> Send(T msg) const noexcept {
    return router_->SendFrom(link_.c_str(), name_.c_str(), std::move(msg));
  }

  template <typename T>
  expected<void, LinkError> TrySend(T msg) const noexcept {
    return router_->TrySendFrom(link_.c_str(), name_.c_str(), std::move(msg));
  }

  template <typename T>
  expected<PathwayReceiver<T>, LinkError> TakeReceiver() const noexcept {
    return router_->template TakeLinkReceiver<T>(link_.c_str(), name_.c_str());
  }

  const char* Link() const noexcept { return link_.c_str(); }
  const char* Name() const noexcept { return name_.c_str(); }

 private:
  std::shared_ptr<const Router<Payload>> router_;
  NameString link_;
  NameString name_;
};

template <typename Payload>
struct LinkEndpoints {
  LinkEndpoint<Payload> endpoint1;
  LinkEndpoint<Payload> endpoint2;
};

/** @brief Handles for both ends of @p spec on @p router. */
template <typename Payload>
LinkEndpoints<Payload> MakeLinkEndpoints(
    const std::shared_ptr<const Router<Payload>>& router,
    const LinkSpec& spec) noexcept {
  return LinkEndpoints<Payload>{
      LinkEndpoint<Payload>(router, spec.name.c_str(),
                            spec.endpoint1.name.c_str()),
      LinkEndpoint<Payload>(router, spec.name.c_str(),
                            spec.endpoint2.name.c_str())};
}

}  // namespace xlink

#endif  // XLINK_LINK_BUILDER_HPP_
