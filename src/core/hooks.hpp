// core/hooks.hpp - External collaborators of the pipeline
#pragma once

#include "report.hpp"
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace offload {

struct RunSummary {
  std::string profile;
  size_t file_count = 0;
  uint64_t total_bytes = 0;
  std::string import_date;
  fs::path day_folder; // <camera>/<date>, below whichever root is routed
};

std::string describe_summary(const RunSummary &summary);

// Go/no-go before anything is written to the destination
class ConfirmationGate {
public:
  virtual ~ConfirmationGate() = default;
  virtual bool confirm(const RunSummary &summary) = 0;
};

// Receives the terminal transition (Done or Failed). Delivery problems are
// reported through the return value and never change the run outcome.
class Notifier {
public:
  virtual ~Notifier() = default;
  virtual bool notify(const RunReport &report) = 0;
};

// Runs a shell command with OFFLOAD_STATE, OFFLOAD_KIND, OFFLOAD_MESSAGE,
// OFFLOAD_PROFILE and OFFLOAD_DESTINATION exported.
class CommandNotifier : public Notifier {
public:
  explicit CommandNotifier(std::string command) : command_(std::move(command)) {}
  bool notify(const RunReport &report) override;

  // The full shell line, exposed for tests
  std::string build_command(const RunReport &report) const;

private:
  std::string command_;
};

// Prints the summary and reads y/N
class TerminalConfirmationGate : public ConfirmationGate {
public:
  TerminalConfirmationGate(std::istream &in, std::ostream &out)
      : in_(in), out_(out) {}
  bool confirm(const RunSummary &summary) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

} // namespace offload
