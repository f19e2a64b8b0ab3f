// core/router.hpp - Destination routing
#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

enum class Reachability { ReachableRemote, ReachableLocal, Unreachable };

struct ReachabilityState {
  Reachability state = Reachability::Unreachable;
  std::chrono::system_clock::time_point probed_at;
  std::string detail;
};

enum class DestinationKind { Store, Staging };

struct Route {
  DestinationKind kind = DestinationKind::Store;
  fs::path root;
  ReachabilityState reachability;
};

const char *reachability_to_string(Reachability r);
const char *destination_kind_to_string(DestinationKind kind);

// Network-store reachability check. Must return within its timeout.
class StoreProbe {
public:
  virtual ~StoreProbe() = default;
  virtual bool probe(std::string &detail) = 0;
};

// TCP connect to host:port bounded by timeout_ms, then a writability check
// of the mounted store root. Without a host only the mount is checked.
class TcpStoreProbe : public StoreProbe {
public:
  TcpStoreProbe(std::string host, int port, int timeout_ms, fs::path store_root)
      : host_(std::move(host)), port_(port), timeout_ms_(timeout_ms),
        store_root_(std::move(store_root)) {}

  bool probe(std::string &detail) override;

private:
  bool tcp_connect(std::string &detail) const;

  std::string host_;
  int port_;
  int timeout_ms_;
  fs::path store_root_;
};

// Decided once per run. `cleared` holds the roots that passed the
// collision check; a root outside it is never chosen.
// Throws OffloadError(NoDestinationAvailable).
Route route_destination(const fs::path &store_root,
                        const fs::path &staging_root, StoreProbe &probe,
                        const std::vector<fs::path> &cleared);

} // namespace offload
