// core/pipeline.cpp - Offload pipeline orchestration implementation
#include "pipeline.hpp"
#include "../utils.hpp"
#include "cleanup.hpp"
#include "collision.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "identify.hpp"
#include "verifier.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace offload {

static constexpr int BACKOFF_SLICE_MS = 50;
static constexpr int MAX_BACKOFF_SHIFT = 10;

Orchestrator::Orchestrator(Config config, ProfileSet profiles,
                           MetadataReader &reader, StoreProbe &probe,
                           Collaborators collaborators)
    : config_(std::move(config)), profiles_(std::move(profiles)),
      reader_(reader), probe_(probe), hooks_(collaborators) {}

void Orchestrator::enter(PipelineState next, RunReport &report) {
  // Strictly forward; Failed is reachable from anywhere but Done
  if (state_ == PipelineState::Done || state_ == PipelineState::Failed ||
      (next != PipelineState::Failed && next <= state_)) {
    throw std::logic_error(std::string("illegal transition ") +
                           pipeline_state_to_string(state_) + " -> " +
                           pipeline_state_to_string(next));
  }
  state_ = next;
  report.state = next;
  report.transitions.push_back({next, timestamp_now()});
  LOG_INFO(std::string("State: ") + pipeline_state_to_string(next));
}

void Orchestrator::fail(RunReport &report, std::optional<ErrorKind> kind,
                        const std::string &message, const std::string &detail) {
  report.failure_kind = kind;
  report.message = message;
  report.detail = detail;
  LOG_ERROR(std::string("Run failed (") +
            (kind ? error_kind_to_string(*kind) : "Internal") +
            "): " + message);
  if (!detail.empty()) {
    LOG_DEBUG(detail);
  }
  if (state_ != PipelineState::Failed && state_ != PipelineState::Done) {
    enter(PipelineState::Failed, report);
  }
}

void Orchestrator::check_cancelled(const char *stage) const {
  if (hooks_.token && hooks_.token->cancelled()) {
    throw OffloadError(ErrorKind::Cancelled,
                       std::string("Cancelled after ") + stage);
  }
}

void Orchestrator::wait_backoff(int64_t delay_ms) const {
  auto until = std::chrono::steady_clock::now() +
               std::chrono::milliseconds(delay_ms);
  while (std::chrono::steady_clock::now() < until) {
    check_cancelled("transfer backoff");
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        until - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(
        std::min(left, std::chrono::milliseconds(BACKOFF_SLICE_MS)));
  }
}

TransferStats Orchestrator::transfer_with_retry(
    const std::vector<MediaFile> &files, RunReport &report) {
  TransferControl control;
  control.token = hooks_.token;
  control.progress = hooks_.progress;

  for (int attempt = 0;; ++attempt) {
    report.transfer_attempts = attempt + 1;
    TransferStats stats;
    try {
      transfer_files(files, report.day_folder, control, stats);
      report.files_written += stats.copied;
      report.bytes_written += stats.bytes;
      return stats;
    } catch (const OffloadError &e) {
      // Whatever landed before the failure still counts for the run
      report.transfer = stats;
      report.files_written += stats.copied;
      report.bytes_written += stats.bytes;
      if (e.kind() != ErrorKind::TransferError ||
          attempt >= config_.transfer_retries) {
        throw;
      }
      int64_t delay = static_cast<int64_t>(config_.retry_backoff_ms)
                      << std::min(attempt, MAX_BACKOFF_SHIFT);
      LOG_WARN(std::string("Transfer attempt ") + std::to_string(attempt + 1) +
               " failed: " + e.what() + "; retrying in " +
               std::to_string(delay) + "ms");
      wait_backoff(delay);
    }
  }
}

void Orchestrator::execute(RunReport &report) {
  const fs::path &source_root = report.source_root;

  enter(PipelineState::Identifying, report);
  auto identifier = CameraIdentifier::from_profiles(
      profiles_, config_.metadata_samples, config_.confidence_threshold);
  Identification id = identifier.identify(source_root, reader_);
  const CameraProfile &profile = *id.profile;
  report.profile = profile.name;
  report.confidence = id.confidence.score;
  check_cancelled("identification");

  enter(PipelineState::CheckingCollision, report);
  fs::path day = profile.day_folder(report.import_date);
  auto cleared = check_collision({config_.store_root, config_.staging_root}, day);

  std::vector<MediaFile> files;
  try {
    files = scan_media(source_root, profile);
  } catch (const fs::filesystem_error &e) {
    throw OffloadError(ErrorKind::TransferError,
                       "Cannot enumerate source " + source_root.string(),
                       e.what());
  }
  report.transfer.total = files.size();
  if (files.empty()) {
    // Nothing to import; no day-folder is created so a later card that
    // day is not blocked
    LOG_WARN("No media files found for " + profile.name + " in " +
             source_root.string());
    report.warnings.push_back("no media files found");
    return;
  }

  if (hooks_.gate) {
    RunSummary summary;
    summary.profile = profile.name;
    summary.file_count = files.size();
    summary.total_bytes = total_bytes(files);
    summary.import_date = report.import_date;
    summary.day_folder = day;
    if (!hooks_.gate->confirm(summary)) {
      throw OffloadError(ErrorKind::Cancelled,
                         "Offload declined at confirmation");
    }
  }
  check_cancelled("collision check");

  // Probed only once the gate has answered
  enter(PipelineState::Routing, report);
  Route route = route_destination(config_.store_root, config_.staging_root,
                                  probe_, cleared);
  report.route = route;
  report.day_folder = route.root / day;
  check_cancelled("routing");

  enter(PipelineState::Transferring, report);
  LOG_INFO("Transferring " + std::to_string(files.size()) + " files (" +
           format_size(total_bytes(files)) + ") to " +
           report.day_folder.string());
  mark_import_incomplete(report.day_folder, "profile=" + profile.name +
                                                "\ndate=" + report.import_date +
                                                "\nstarted=" +
                                                report.started_at);
  report.transfer = transfer_with_retry(files, report);
  check_cancelled("transfer");

  enter(PipelineState::Verifying, report);
  report.verification = verify_transfer(source_root, report.day_folder,
                                        profile, config_.digest_workers);
  if (!report.verification->passed) {
    throw OffloadError(ErrorKind::VerificationError,
                       "Destination does not match source",
                       report.verification->describe_failures());
  }
  if (!mark_import_complete(report.day_folder)) {
    report.warnings.push_back("import marker could not be removed");
  }

  if (!config_.delete_after_verify) {
    LOG_INFO("Source kept (delete_after_verify not set)");
    return;
  }
  check_cancelled("verification");

  enter(PipelineState::CleaningUp, report);
  CleanupRequest request;
  request.source_root = source_root;
  request.day_folder = report.day_folder;
  request.audit_dir = config_.audit_dir;
  request.run_started = report.started_at;
  request.profile = &profile;
  request.report = &*report.verification;

  CleanupResult cleaned = cleanup_source(request);
  report.cleanup_performed = !cleaned.audit_path.empty();
  report.audit_path = cleaned.audit_path;
  report.deleted = cleaned.deleted;
  for (const auto &failure : cleaned.failures) {
    report.warnings.push_back(
        std::string(error_kind_to_string(ErrorKind::CleanupError)) + ": " +
        failure);
  }
}

RunReport Orchestrator::run(const fs::path &source_root) {
  if (state_ != PipelineState::Idle) {
    throw std::logic_error("orchestrator already ran");
  }

  RunReport report;
  report.started_at = timestamp_now();
  report.source_root = source_root;
  report.import_date = today_stamp();
  report.transitions.push_back({PipelineState::Idle, report.started_at});
  LOG_INFO("Offload started for " + source_root.string());

  try {
    execute(report);
    enter(PipelineState::Done, report);
  } catch (const OffloadError &e) {
    fail(report, e.kind(), e.what(), e.detail());
  } catch (const std::exception &e) {
    fail(report, std::nullopt, e.what(), "");
  }
  report.finished_at = timestamp_now();

  if (hooks_.notifier && !hooks_.notifier->notify(report)) {
    report.warnings.push_back("notification not delivered");
  }
  return report;
}

} // namespace offload
