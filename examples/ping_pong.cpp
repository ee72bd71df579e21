/**
 * @file ping_pong.cpp
 * @brief Two threads exchanging Ping/Pong over a bidirectional link, plus a
 *        unidirectional monitor link.
 *
 * Demonstrates:
 *   - Declaring links with LinkSpec and building a sealed Router
 *   - Claiming each endpoint's receiver exactly once
 *   - LinkEndpoint handles for the two ends of a link
 *   - Sending by link name from several threads through a shared router
 *   - Timed receive as an idle exit for long-running consumers
 */

#include "xlink/link_builder.hpp"
#include "xlink/log.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <thread>
#include <variant>

// -- Message types ----------------------------------------------------------

struct Ping {
  char text[48];
  uint32_t seq;
};

struct Pong {
  char text[48];
  uint32_t seq;
};

struct SystemStatus {
  uint32_t update;
  uint32_t cpu_percent;
};

using Payload = std::variant<Ping, Pong, SystemStatus>;
using AppRouter = xlink::Router<Payload>;

XLINK_MESSAGE_NAME(Ping, "Ping")
XLINK_MESSAGE_NAME(Pong, "Pong")
XLINK_MESSAGE_NAME(SystemStatus, "SystemStatus")

// ---------------------------------------------------------------------------

static constexpr uint32_t kRounds = 3U;
static constexpr uint32_t kStatusUpdates = 5U;
static constexpr uint64_t kIdleTimeoutUs = 1000000U;

int main() {
  xlink::log::Init();
  xlink::log::SetLevel(xlink::log::Level::kInfo);

  const xlink::LinkSpec links[] = {
      {"PingerPongerLink", {"Pinger", "Ping"}, {"Ponger", "Pong"}, 8},
      {"SystemMonitorLink", {"MonitorSender", "SystemStatus"},
       {"MonitorReceiver", ""}, 4},
  };
  auto made = xlink::MakeRouter<Payload>(links, 2);
  if (!made.has_value()) {
    XLINK_LOG_ERROR("ping_pong", "router build failed: %s",
                    xlink::LinkErrorToString(made.get_error()));
    return 1;
  }
  std::shared_ptr<const AppRouter> router = made.value();

  auto exchange = xlink::MakeLinkEndpoints(router, links[0]);
  auto pinger_rx = exchange.endpoint1.TakeReceiver<Pong>();
  auto ponger_rx = exchange.endpoint2.TakeReceiver<Ping>();
  auto monitor_rx = router->TakeLinkReceiver<SystemStatus>(
      "SystemMonitorLink", "MonitorReceiver");
  if (!pinger_rx.has_value() || !ponger_rx.has_value() ||
      !monitor_rx.has_value()) {
    XLINK_LOG_ERROR("ping_pong", "receiver claim failed");
    return 1;
  }

  // --- Pinger ---
  std::thread pinger([ep = exchange.endpoint1,
                      rx = std::move(pinger_rx.value())]() mutable {
    for (uint32_t i = 0; i < kRounds; ++i) {
      Ping ping{};
      std::snprintf(ping.text, sizeof(ping.text), "ping from pinger (%u)", i);
      ping.seq = i;
      std::printf("[Pinger] Sending: %s\n", ping.text);
      auto sent = ep.Send(ping);
      if (!sent.has_value()) {
        XLINK_LOG_ERROR("Pinger", "send failed: %s",
                        xlink::LinkErrorToString(sent.get_error()));
        return;
      }
      auto reply = rx.Recv();
      if (!reply.has_value()) {
        std::printf("[Pinger] Channel closed by ponger.\n");
        return;
      }
      std::printf("[Pinger] Received reply #%u: %s\n", reply->seq,
                  reply->text);
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  // --- Ponger ---
  std::thread ponger([ep = exchange.endpoint2,
                      rx = std::move(ponger_rx.value())]() mutable {
    for (;;) {
      auto ping = rx.RecvFor(kIdleTimeoutUs);
      if (!ping.has_value()) {
        std::printf("[Ponger] Stopping (%s).\n",
                    xlink::LinkErrorToString(ping.get_error()));
        break;
      }
      std::printf("[Ponger] Received: %s\n", ping.value().text);
      Pong pong{};
      std::snprintf(pong.text, sizeof(pong.text), "pong for #%u",
                    ping.value().seq);
      pong.seq = ping.value().seq;
      auto sent = ep.Send(pong);
      if (!sent.has_value()) {
        XLINK_LOG_ERROR("Ponger", "send failed: %s",
                        xlink::LinkErrorToString(sent.get_error()));
        break;
      }
    }
  });

  // --- Monitor sender (unidirectional link) ---
  std::thread monitor_tx([router]() {
    for (uint32_t i = 0; i < kStatusUpdates; ++i) {
      const SystemStatus status{i, 10U + i * 7U};
      std::printf("[MonitorSender] Broadcasting update #%u\n", i);
      auto sent = router->Send("SystemMonitorLink", status);
      if (!sent.has_value()) {
        XLINK_LOG_WARN("MonitorSender", "broadcast failed: %s",
                       xlink::LinkErrorToString(sent.get_error()));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  // --- Monitor receiver ---
  std::thread monitor_rx_thread(
      [rx = std::move(monitor_rx.value())]() mutable {
        for (;;) {
          auto status = rx.RecvFor(kIdleTimeoutUs);
          if (!status.has_value()) break;
          std::printf("[MonitorReceiver] update #%u cpu=%u%%\n",
                      status.value().update, status.value().cpu_percent);
        }
        std::printf("[MonitorReceiver] Monitor channel idle, exiting.\n");
      });

  pinger.join();
  monitor_tx.join();
  ponger.join();
  monitor_rx_thread.join();

  std::printf("Example finished.\n");
  xlink::log::Shutdown();
  return 0;
}
