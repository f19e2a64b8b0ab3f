// core/pipeline.hpp - Offload pipeline orchestration
#pragma once

#include "../conf/config.hpp"
#include "../conf/profiles.hpp"
#include "cancel.hpp"
#include "executor.hpp"
#include "hooks.hpp"
#include "inventory.hpp"
#include "metadata.hpp"
#include "report.hpp"
#include "router.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace offload {

// Optional, non-owning. Absent collaborators are skipped.
struct Collaborators {
  ConfirmationGate *gate = nullptr;
  Notifier *notifier = nullptr;
  const CancellationToken *token = nullptr;
  ProgressCallback progress; // called after each file in Transferring
};

// Drives one import run through
// Idle -> Identifying -> CheckingCollision -> Routing -> Transferring ->
// Verifying -> CleaningUp -> Done, or to Failed from any stage.
// The source is only modified in CleaningUp.
class Orchestrator {
public:
  Orchestrator(Config config, ProfileSet profiles, MetadataReader &reader,
               StoreProbe &probe, Collaborators collaborators = {});

  // Never throws for pipeline failures; they end up in the report.
  // An orchestrator runs once.
  RunReport run(const fs::path &source_root);

  PipelineState state() const { return state_; }

private:
  void execute(RunReport &report);
  void enter(PipelineState next, RunReport &report);
  void fail(RunReport &report, std::optional<ErrorKind> kind,
            const std::string &message, const std::string &detail);
  void check_cancelled(const char *stage) const;
  void wait_backoff(int64_t delay_ms) const;
  TransferStats transfer_with_retry(const std::vector<MediaFile> &files,
                                    RunReport &report);

  Config config_;
  ProfileSet profiles_;
  MetadataReader &reader_;
  StoreProbe &probe_;
  Collaborators hooks_;
  PipelineState state_ = PipelineState::Idle;
};

} // namespace offload
