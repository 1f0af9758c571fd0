// -----------------------------------------------------------------------------
// nanotrade — single executable entry point.
//
//   nanotrade [config.json]
//
//   1) Load the EngineConfig (defaults when no path is given).
//   2) Load the classifier weights from config.weights_dir, if set.
//   3) Start the DetectionEngine: tick loop, IPC server, market data feed.
//   4) Wait for Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread          waits on g_shutdown
//   tick loop thread     TickProcessor (every pipeline step)
//   market data thread   MarketDataGateway (ZMQ SUB)
//   ipc thread           IpcServer (ZMQ REP + PUB)
// -----------------------------------------------------------------------------

#include "nanotrade/config/config_loader.hpp"
#include "nanotrade/engine/detection_engine.hpp"
#include "nanotrade/ml/model_weights.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

// Set by the SIGINT handler, polled by main(). The only global.
static std::atomic<bool> g_shutdown{false};

static void sigint_handler(int /*signum*/) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration and model.
  // -------------------------------------------------------------------------
  nanotrade::domain::EngineConfig config;
  nanotrade::ModelWeights weights;

  try {
    if (argc > 1) {
      config = nanotrade::loadEngineConfig(argv[1]);
      std::cout << "[main] config loaded from " << argv[1] << "\n";
    }
    if (!config.weights_dir.empty()) {
      weights = nanotrade::loadModelWeights(config.weights_dir);
      std::cout << "[main] model weights loaded from " << config.weights_dir
                << "\n";
    } else {
      std::cout << "[main] no weights_dir configured; classifier reports "
                   "NORMAL only.\n";
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[main] malformed config: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] startup failed: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Start the engine.
  // -------------------------------------------------------------------------
  nanotrade::DetectionEngine engine(config, std::move(weights));

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] engine failed to start: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] feed on " << config.market_data_endpoint
            << ", commands on " << config.ipc_cmd_endpoint
            << ", telemetry on " << config.ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 3) Idle until SIGINT.
  // -------------------------------------------------------------------------
  while (!g_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  const nanotrade::EngineStatus status = engine.status();
  std::cout << "\n[main] SIGINT received after " << status.ticks
            << " tick(s): " << status.alerts << " alert(s), "
            << status.matches << " match(es), " << status.cascades
            << " cascade(s). Stopping engine...\n";
  engine.stop();

  return 0;
}
