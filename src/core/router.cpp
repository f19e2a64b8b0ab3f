// core/router.cpp - Destination routing implementation
#include "router.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace offload {

const char *reachability_to_string(Reachability r) {
  switch (r) {
  case Reachability::ReachableRemote:
    return "reachable-remote";
  case Reachability::ReachableLocal:
    return "reachable-local";
  case Reachability::Unreachable:
    return "unreachable";
  }
  return "unknown";
}

const char *destination_kind_to_string(DestinationKind kind) {
  return kind == DestinationKind::Store ? "store" : "staging";
}

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo *ai) const { freeaddrinfo(ai); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

class SocketGuard {
public:
  explicit SocketGuard(int fd) : fd_(fd) {}
  ~SocketGuard() {
    if (fd_ >= 0)
      close(fd_);
  }
  SocketGuard(const SocketGuard &) = delete;
  SocketGuard &operator=(const SocketGuard &) = delete;
  int get() const { return fd_; }

private:
  int fd_;
};

// Shared between a probe and its resolver thread. Whichever side finishes
// last owns the result.
struct Resolution {
  std::mutex mutex;
  std::condition_variable done_cv;
  addrinfo *result = nullptr;
  bool done = false;
  bool abandoned = false;
};

// getaddrinfo has no timeout of its own. On timeout the probe reports
// unreachable and the single detached resolver frees its own result when
// the system resolver returns (bounded by resolv.conf timeouts).
AddrInfoPtr resolve(const std::string &host, int port,
                    std::chrono::milliseconds budget, std::string &detail) {
  auto state = std::make_shared<Resolution>();
  std::string port_str = std::to_string(port);

  std::thread([state, host, port_str]() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res) != 0) {
      res = nullptr;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->abandoned) {
      if (res)
        freeaddrinfo(res);
      return;
    }
    state->result = res;
    state->done = true;
    state->done_cv.notify_one();
  }).detach();

  std::unique_lock<std::mutex> lock(state->mutex);
  if (!state->done_cv.wait_for(lock, budget, [&] { return state->done; })) {
    state->abandoned = true;
    detail = "name resolution timed out for " + host;
    return nullptr;
  }

  AddrInfoPtr ai(state->result);
  state->result = nullptr;
  if (!ai) {
    detail = "cannot resolve " + host;
  }
  return ai;
}

} // namespace

bool TcpStoreProbe::tcp_connect(std::string &detail) const {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeout_ms_);

  AddrInfoPtr addrs =
      resolve(host_, port_, std::chrono::milliseconds(timeout_ms_), detail);
  if (!addrs) {
    return false;
  }

  for (addrinfo *ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
    SocketGuard sock(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (sock.get() < 0) {
      detail = std::string("socket: ") + strerror(errno);
      continue;
    }

    int flags = fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
      detail = std::string("fcntl: ") + strerror(errno);
      continue;
    }

    int rc = connect(sock.get(), ai->ai_addr, ai->ai_addrlen);
    if (rc == 0) {
      return true;
    }
    if (errno != EINPROGRESS) {
      detail = std::string("connect: ") + strerror(errno);
      continue;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      detail = "connect timed out";
      return false;
    }

    pollfd pfd{};
    pfd.fd = sock.get();
    pfd.events = POLLOUT;
    rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc == 0) {
      detail = "connect timed out after " + std::to_string(timeout_ms_) + "ms";
      return false;
    }
    if (rc < 0) {
      detail = std::string("poll: ") + strerror(errno);
      continue;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 &&
        so_error == 0) {
      return true;
    }
    detail = std::string("connect: ") + strerror(so_error);
  }
  return false;
}

bool TcpStoreProbe::probe(std::string &detail) {
  if (store_root_.empty()) {
    detail = "no store configured";
    return false;
  }

  if (!host_.empty()) {
    if (!tcp_connect(detail)) {
      LOG_WARN("Store " + host_ + ":" + std::to_string(port_) +
               " unreachable: " + detail);
      return false;
    }
    LOG_DEBUG("Store " + host_ + ":" + std::to_string(port_) + " answered");
  }

  if (!is_writable_dir(store_root_)) {
    detail = "store root " + store_root_.string() + " not mounted or not writable";
    LOG_WARN(detail);
    return false;
  }

  detail = "store root " + store_root_.string() + " reachable";
  return true;
}

static bool cleared_root(const std::vector<fs::path> &cleared,
                         const fs::path &root) {
  return std::find(cleared.begin(), cleared.end(), root) != cleared.end();
}

Route route_destination(const fs::path &store_root,
                        const fs::path &staging_root, StoreProbe &probe,
                        const std::vector<fs::path> &cleared) {
  Route route;
  route.reachability.probed_at = std::chrono::system_clock::now();

  std::string detail;
  if (!store_root.empty() && cleared_root(cleared, store_root) &&
      probe.probe(detail)) {
    route.kind = DestinationKind::Store;
    route.root = store_root;
    route.reachability.state = Reachability::ReachableRemote;
    route.reachability.detail = detail;
    LOG_INFO("Using transfer mode: direct to store (" + store_root.string() +
             ")");
    return route;
  }

  std::string store_detail = detail.empty() ? "store not eligible" : detail;

  if (!staging_root.empty() && cleared_root(cleared, staging_root) &&
      ensure_dir_exists(staging_root) && is_writable_dir(staging_root)) {
    route.kind = DestinationKind::Staging;
    route.root = staging_root;
    route.reachability.state = Reachability::ReachableLocal;
    route.reachability.detail = store_detail;
    LOG_WARN("Store unavailable (" + store_detail +
             "), staging locally at " + staging_root.string());
    return route;
  }

  route.reachability.state = Reachability::Unreachable;
  throw OffloadError(ErrorKind::NoDestinationAvailable,
                     "Neither the store nor local staging is available",
                     store_detail);
}

} // namespace offload
