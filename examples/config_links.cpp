/**
 * @file config_links.cpp
 * @brief Build a router from a link topology file.
 *
 * Usage: config_links [path/to/links.ini|.json|.yaml]
 *
 * Loads [log] and the link sections, builds a sealed router, then pushes one
 * message through every direction of every link and reads it back.
 */

#include "xlink/config.hpp"
#include "xlink/link_builder.hpp"
#include "xlink/link_config.hpp"
#include "xlink/log.hpp"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <variant>

struct Ping {
  uint32_t seq;
};

struct Pong {
  uint32_t seq;
};

struct SystemStatus {
  uint32_t cpu_percent;
};

using Payload = std::variant<Ping, Pong, SystemStatus>;
using AppRouter = xlink::Router<Payload>;

XLINK_MESSAGE_NAME(Ping, "Ping")
XLINK_MESSAGE_NAME(Pong, "Pong")
XLINK_MESSAGE_NAME(SystemStatus, "SystemStatus")

namespace {

/// Send one default-constructed T from @p from and receive it at @p to.
template <typename T>
bool Probe(const AppRouter& router, const xlink::LinkSpec& link,
           const xlink::EndpointSpec& from, const xlink::EndpointSpec& to) {
  auto rx = router.TakeLinkReceiver<T>(link.name.c_str(), to.name.c_str());
  if (!rx.has_value()) {
    XLINK_LOG_ERROR("config_links", "%s: no receiver at %s (%s)",
                    link.name.c_str(), to.name.c_str(),
                    xlink::LinkErrorToString(rx.get_error()));
    return false;
  }
  auto sent = router.TrySendFrom(link.name.c_str(), from.name.c_str(), T{});
  if (!sent.has_value()) {
    XLINK_LOG_ERROR("config_links", "%s: send from %s failed (%s)",
                    link.name.c_str(), from.name.c_str(),
                    xlink::LinkErrorToString(sent.get_error()));
    return false;
  }
  auto got = rx.value().TryRecv();
  std::printf("  %-20s %s -> %s : %s %s\n", link.name.c_str(),
              from.name.c_str(), to.name.c_str(), from.sends.c_str(),
              got.has_value() ? "delivered" : "lost");
  return got.has_value();
}

bool ProbeDirection(const AppRouter& router, const xlink::LinkSpec& link,
                    const xlink::EndpointSpec& from,
                    const xlink::EndpointSpec& to) {
  if (from.sends.empty()) return true;
  if (from.sends == "Ping") return Probe<Ping>(router, link, from, to);
  if (from.sends == "Pong") return Probe<Pong>(router, link, from, to);
  if (from.sends == "SystemStatus") {
    return Probe<SystemStatus>(router, link, from, to);
  }
  return false;
}

}  // namespace

int main(int argc, char* argv[]) {
  const char* path = (argc > 1) ? argv[1] : "links.ini";
  xlink::log::Init();

  xlink::MultiConfig cfg;
  auto loaded = cfg.LoadFile(path);
  if (!loaded.has_value()) {
    XLINK_LOG_ERROR("config_links", "cannot load %s (error %u)", path,
                    static_cast<unsigned>(loaded.get_error()));
    return 1;
  }
  if (!xlink::ApplyLogConfig(cfg).has_value()) return 1;

  xlink::LinkSpec specs[XLINK_MAX_LINKS];
  auto count = xlink::LoadLinkSpecs(cfg, specs, XLINK_MAX_LINKS);
  if (!count.has_value()) return 1;

  auto made = xlink::MakeRouter<Payload>(specs, count.value());
  if (!made.has_value()) {
    XLINK_LOG_ERROR("config_links", "router build failed: %s",
                    xlink::LinkErrorToString(made.get_error()));
    return 1;
  }
  std::shared_ptr<const AppRouter> router = made.value();
  std::printf("%u links, %u routes from %s\n", count.value(),
              router->RouteCount(), path);

  bool ok = true;
  for (uint32_t i = 0; i < count.value(); ++i) {
    const xlink::LinkSpec& link = specs[i];
    ok = ProbeDirection(*router, link, link.endpoint1, link.endpoint2) && ok;
    ok = ProbeDirection(*router, link, link.endpoint2, link.endpoint1) && ok;
  }

  xlink::log::Shutdown();
  return ok ? 0 : 1;
}
