#ifdef RTSPMON_HAVE_URING

#include "app/MetricsServer.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/time.h>
#include <sys/uio.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <charconv>
#include <utility>

namespace rtspmon::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

constexpr size_t kMaxConnections = 32;
constexpr int kClientTimeoutSeconds = 5;

MetricsServer::MetricsServer(const MetricsRegistry& registry, ServerOptions opts)
    : registry_(registry), opts_(std::move(opts)) {}

MetricsServer::~MetricsServer() { stop(); }

void MetricsServer::close_fds() {
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

bool MetricsServer::start() {
  const char* host = opts_.host.empty() ? nullptr : opts_.host.c_str();
  char port_buf[8];
  auto [pend, pec] = std::to_chars(port_buf, port_buf + sizeof(port_buf) - 1, opts_.port);
  *pend = '\0';

  struct addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
  struct addrinfo* res = nullptr;
  if (int rc = ::getaddrinfo(host, port_buf, &hints, &res); rc != 0 || !res) {
    std::fprintf(stderr, "rtspmon: metrics server: cannot resolve '%s': %s\n",
                 opts_.host.c_str(), ::gai_strerror(rc));
    return false;
  }

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "rtspmon: metrics server: socket() failed: %s\n", std::strerror(errno));
    ::freeaddrinfo(res);
    return false;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  int brc = ::bind(listen_fd_, res->ai_addr, res->ai_addrlen);
  ::freeaddrinfo(res);
  if (brc < 0) {
    std::fprintf(stderr, "rtspmon: metrics server: bind(%s:%d) failed: %s\n",
                 opts_.host.c_str(), opts_.port, std::strerror(errno));
    close_fds();
    return false;
  }

  if (::listen(listen_fd_, 16) < 0) {
    std::fprintf(stderr, "rtspmon: metrics server: listen() failed: %s\n", std::strerror(errno));
    close_fds();
    return false;
  }

  struct sockaddr_in bound{};
  socklen_t blen = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &blen) == 0)
    bound_port_ = ntohs(bound.sin_port);
  else
    bound_port_ = opts_.port;

  // eventfd for clean shutdown
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "rtspmon: metrics server: eventfd() failed: %s\n", std::strerror(errno));
    close_fds();
    return false;
  }

  std::fprintf(stderr, "rtspmon: metrics server listening on %s:%d%s\n",
               opts_.host.c_str(), bound_port_, opts_.path.c_str());
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return true;
}

void MetricsServer::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  close_fds();
}

void MetricsServer::run(std::stop_token st) {
  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "rtspmon: metrics server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      std::fprintf(stderr, "rtspmon: metrics server: io_uring_wait_cqe() failed: %s\n", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) break;

    if (tag == UringTag::ListenPoll) {
      if (res >= 0) {
        int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd >= 0) accept_client(client_fd);
      }
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  prune_connections(true);
  io_uring_queue_exit(&ring);
}

void MetricsServer::accept_client(int client_fd) {
  prune_connections(false);
  if (connections_.size() >= kMaxConnections) {
    std::fprintf(stderr, "rtspmon: metrics server: warning: %zu clients in flight, dropping one\n",
                 connections_.size());
    ::close(client_fd);
    return;
  }
  Connection& c = connections_.emplace_back();
  c.fd = client_fd;
  c.thread = std::jthread([this, &c]{
    handle_client(c.fd);
    // FIN now; the fd itself is closed when the entry is pruned.
    ::shutdown(c.fd, SHUT_RDWR);
    c.done.store(true, std::memory_order_release);
  });
}

// Joins and closes finished clients; with `all`, cuts off the rest first.
void MetricsServer::prune_connections(bool all) {
  for (auto it = connections_.begin(); it != connections_.end();) {
    if (all) ::shutdown(it->fd, SHUT_RDWR);
    if (!all && !it->done.load(std::memory_order_acquire)) { ++it; continue; }
    if (it->thread.joinable()) it->thread.join();
    ::close(it->fd);
    it = connections_.erase(it);
  }
}

static std::string response_head(const char* status, const char* content_type, size_t length) {
  std::string headers = "HTTP/1.1 ";
  headers += status;
  headers += "\r\nContent-Type: ";
  headers += content_type;
  headers += "\r\nConnection: close\r\nContent-Length: ";
  char len_buf[24];
  auto [ptr, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), length);
  headers.append(len_buf, ptr);
  headers += "\r\n\r\n";
  return headers;
}

// Writes every byte of the iovecs, resuming after partial writes.
static bool send_all(int fd, struct iovec* iov, size_t count) {
  while (count > 0) {
    if (iov->iov_len == 0) { ++iov; --count; continue; }
    struct msghdr msg{};
    msg.msg_iov = iov;
    msg.msg_iovlen = count;
    ssize_t n = ::sendmsg(fd, &msg, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    auto sent = static_cast<size_t>(n);
    while (count > 0 && sent >= iov->iov_len) {
      sent -= iov->iov_len;
      ++iov;
      --count;
    }
    if (count > 0) {
      iov->iov_base = static_cast<char*>(iov->iov_base) + sent;
      iov->iov_len -= sent;
    }
  }
  return true;
}

void MetricsServer::handle_client(int fd) {
  struct timeval tv{.tv_sec = kClientTimeoutSeconds, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  // Read up to the end of the headers; a request may arrive in pieces.
  char reqbuf[4096];
  size_t have = 0;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(kClientTimeoutSeconds);
  while (have < sizeof(reqbuf)) {
    ssize_t nr = ::recv(fd, reqbuf + have, sizeof(reqbuf) - have, 0);
    if (nr < 0 && errno == EINTR) continue;
    if (nr <= 0) break;
    have += static_cast<size_t>(nr);
    if (std::string_view(reqbuf, have).contains("\r\n\r\n")) break;
    if (std::chrono::steady_clock::now() >= deadline) break;
  }
  if (have == 0) return;

  std::string_view req(reqbuf, have);
  auto line_end = req.find_first_of("\r\n");
  std::string_view request_line = req.substr(0, line_end);

  // "METHOD target HTTP/x"; the query string does not take part in routing.
  std::string_view method, target;
  if (auto sp = request_line.find(' '); sp != std::string_view::npos) {
    method = request_line.substr(0, sp);
    target = request_line.substr(sp + 1);
    if (auto sp2 = target.find(' '); sp2 != std::string_view::npos) target = target.substr(0, sp2);
    if (auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);
  }

  std::string headers;
  std::string body;

  if (method != "GET" && method != "HEAD") {
    body = "405 Method Not Allowed\n";
    headers = response_head("405 Method Not Allowed", "text/plain", body.size());
  } else if (target == opts_.path) {
    body = registry_to_prometheus(registry_);
    headers = response_head("200 OK", "text/plain; version=0.0.4; charset=utf-8", body.size());
  } else if (target == "/") {
    body = "rtspmon: use " + opts_.path + "\n";
    headers = response_head("200 OK", "text/plain", body.size());
  } else {
    body = "404 Not Found\n";
    headers = response_head("404 Not Found", "text/plain", body.size());
  }
  if (method == "HEAD") body.clear();

  // Scatter-gather send: headers + body, no concatenation
  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = body.data(), .iov_len = body.size()}
  };
  if (!send_all(fd, iov, 2))
    std::fprintf(stderr, "rtspmon: metrics server: send failed: %s\n", std::strerror(errno));
}

} // namespace rtspmon::app

#endif // RTSPMON_HAVE_URING
