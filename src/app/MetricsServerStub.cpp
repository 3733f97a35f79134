#include "app/MetricsServer.hpp"
#include <cstdio>

namespace nfsgaze::app {

MetricsServer::MetricsServer(const SnapshotBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
  std::fprintf(stderr, "nfsgaze: metrics server: built without liburing, :%d not served\n", port_);
}

void MetricsServer::stop() {}

} // namespace nfsgaze::app
