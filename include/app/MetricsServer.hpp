#pragma once

#include <cstdint>
#include <string>
#include <thread>
#include "app/SnapshotBuffers.hpp"
#include "model/Snapshot.hpp"

namespace nfsgaze::app {

// Serialize a published Snapshot into Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string snapshot_to_prometheus(const nfsgaze::model::Snapshot& snap);

// Pull endpoint serving GET /metrics from the latest published snapshot.
// Built on io_uring when NFSGAZE_HAVE_URING is defined, otherwise a stub
// that only reports it is unavailable.
class MetricsServer {
public:
  MetricsServer(const SnapshotBuffers& buffers, uint16_t port);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  // Binds the port and spawns the server thread. Logs and returns
  // without a thread when the endpoint cannot be opened.
  void start();
  // Idempotent; joins the server thread.
  void stop();

private:
  bool open_endpoint();
  void run(std::stop_token st);
  void handle_client(int client_fd);

  const SnapshotBuffers& buffers_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace nfsgaze::app
