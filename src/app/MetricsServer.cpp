#ifdef NFSGAZE_HAVE_URING

#include "app/MetricsServer.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <charconv>
#include <string_view>

namespace nfsgaze::app {

// user_data carried by each poll completion
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

MetricsServer::MetricsServer(const SnapshotBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() { stop(); }

static void close_fd(int& fd) {
  if (fd >= 0) ::close(fd);
  fd = -1;
}

// Socket and stop eventfd are created here, on the caller's thread, so
// stop() never sees a descriptor the server thread is still assigning.
bool MetricsServer::open_endpoint() {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "nfsgaze: metrics server: socket() failed: %s\n", std::strerror(errno));
    return false;
  }
  int reuse = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  addr.sin_addr.s_addr = INADDR_ANY;
  const char* failed = nullptr;
  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) failed = "bind()";
  else if (::listen(listen_fd_, 4) < 0) failed = "listen()";
  else if ((stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) < 0) failed = "eventfd()";
  if (failed) {
    std::fprintf(stderr, "nfsgaze: metrics server: %s on :%d failed: %s\n", failed, port_, std::strerror(errno));
    close_fd(stop_eventfd_);
    close_fd(listen_fd_);
    return false;
  }
  return true;
}

void MetricsServer::start() {
  if (thread_.joinable() || !open_endpoint()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void MetricsServer::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    uint64_t one = 1;
    if (::write(stop_eventfd_, &one, sizeof(one)) < 0) {
      std::fprintf(stderr, "nfsgaze: metrics server: eventfd write failed: %s\n", std::strerror(errno));
    }
    thread_.join();
  }
  close_fd(stop_eventfd_);
  close_fd(listen_fd_);
}

// Runs on the server thread. Owns the ring; the descriptors belong to
// start()/stop().
void MetricsServer::run(std::stop_token st) {
  io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "nfsgaze: metrics server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    return;
  }

  auto arm = [&ring](int fd, UringTag tag) {
    io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
    io_uring_submit(&ring);
  };
  arm(listen_fd_, UringTag::ListenPoll);
  arm(stop_eventfd_, UringTag::StopPoll);
  std::fprintf(stderr, "nfsgaze: metrics server listening on :%d\n", port_);

  // The eventfd is written after request_stop(), so a stop issued before
  // the first wait still completes the StopPoll.
  while (!st.stop_requested()) {
    io_uring_cqe* cqe = nullptr;
    if (int rc = io_uring_wait_cqe(&ring, &cqe); rc < 0) {
      if (rc == -EINTR) continue;
      std::fprintf(stderr, "nfsgaze: metrics server: io_uring_wait_cqe() failed: %s\n", std::strerror(-rc));
      break;
    }
    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    bool ready = cqe->res >= 0;
    io_uring_cqe_seen(&ring, cqe);
    if (tag == UringTag::StopPoll) break;

    if (ready) {
      if (int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC); client >= 0) {
        handle_client(client);
        ::close(client);
      }
    }
    arm(listen_fd_, UringTag::ListenPoll);
  }

  io_uring_queue_exit(&ring);
}

static std::string text_response(const char* status, const char* content_type, std::size_t len) {
  std::string headers = "HTTP/1.1 ";
  headers += status;
  headers += "\r\nContent-Type: ";
  headers += content_type;
  headers += "\r\nConnection: close\r\nContent-Length: ";
  char len_buf[24];
  auto [ptr, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), len);
  headers.append(len_buf, ptr);
  headers += "\r\n\r\n";
  return headers;
}

void MetricsServer::handle_client(int fd) {
  // Slow clients must not stall the loop
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  char reqbuf[4096];
  ssize_t nr = ::recv(fd, reqbuf, sizeof(reqbuf) - 1, 0);
  if (nr <= 0) return;

  std::string_view req(reqbuf, static_cast<size_t>(nr));
  auto line_end = req.find('\r');
  if (line_end == std::string_view::npos) line_end = req.find('\n');
  std::string_view request_line = req.substr(0, line_end);

  std::string headers;
  std::string body;

  if (request_line.starts_with("GET /metrics")) {
    body = snapshot_to_prometheus(buffers_.read());
    headers = text_response("200 OK", "text/plain; version=0.0.4; charset=utf-8", body.size());
  } else if (request_line.starts_with("GET / ") || request_line == "GET /") {
    body = "nfsgaze: use /metrics\n";
    headers = text_response("200 OK", "text/plain", body.size());
  } else {
    body = "404 Not Found\n";
    headers = text_response("404 Not Found", "text/plain", body.size());
  }

  // headers + body via scatter-gather, no concatenation
  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = body.data(), .iov_len = body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  if (::sendmsg(fd, &msg, MSG_NOSIGNAL) < 0) {
    std::fprintf(stderr, "nfsgaze: metrics server: sendmsg() failed: %s\n", std::strerror(errno));
  }
}

} // namespace nfsgaze::app

#endif // NFSGAZE_HAVE_URING
