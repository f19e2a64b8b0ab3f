// core/report.hpp - Run report
#pragma once

#include "cleanup.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "router.hpp"
#include "verifier.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

enum class PipelineState {
  Idle,
  Identifying,
  CheckingCollision,
  Routing,
  Transferring,
  Verifying,
  CleaningUp,
  Done,
  Failed,
};

const char *pipeline_state_to_string(PipelineState state);

struct Transition {
  PipelineState state;
  std::string at;
};

struct RunReport {
  PipelineState state = PipelineState::Idle;
  std::optional<ErrorKind> failure_kind; // unset for non-pipeline errors
  std::string message;
  std::string detail;

  std::string started_at;
  std::string finished_at;
  fs::path source_root;
  std::string profile;
  int confidence = 0;
  std::string import_date;
  std::optional<Route> route;
  fs::path day_folder; // absolute once routed

  TransferStats transfer; // last attempt, partial if it failed
  int transfer_attempts = 0;
  size_t files_written = 0; // summed over every attempt
  uint64_t bytes_written = 0;
  std::optional<VerificationReport> verification;

  bool cleanup_performed = false;
  fs::path audit_path;
  size_t deleted = 0;
  std::vector<std::string> warnings;

  std::vector<Transition> transitions;

  bool succeeded() const { return state == PipelineState::Done; }
  int exit_code() const;
  std::string to_json() const;
  bool save(const fs::path &path) const;
};

std::string verification_to_json(const VerificationReport &report,
                                 const std::string &indent = "");

} // namespace offload
