// core/report.cpp - Run report implementation
#include "report.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>
#include <sstream>

namespace offload {

const char *pipeline_state_to_string(PipelineState state) {
  switch (state) {
  case PipelineState::Idle:
    return "Idle";
  case PipelineState::Identifying:
    return "Identifying";
  case PipelineState::CheckingCollision:
    return "CheckingCollision";
  case PipelineState::Routing:
    return "Routing";
  case PipelineState::Transferring:
    return "Transferring";
  case PipelineState::Verifying:
    return "Verifying";
  case PipelineState::CleaningUp:
    return "CleaningUp";
  case PipelineState::Done:
    return "Done";
  case PipelineState::Failed:
    return "Failed";
  }
  return "Unknown";
}

int RunReport::exit_code() const {
  if (state == PipelineState::Done) {
    return EXIT_OK;
  }
  if (failure_kind) {
    return exit_code_for(*failure_kind);
  }
  return EXIT_INTERNAL;
}

static std::string quoted(const std::string &s) {
  return "\"" + json_escape(s) + "\"";
}

std::string verification_to_json(const VerificationReport &report,
                                 const std::string &indent) {
  std::ostringstream out;
  out << "{\n";
  out << indent << "  \"overall\": " << quoted(report.passed ? "Pass" : "Fail")
      << ",\n";
  out << indent << "  \"matched\": " << report.count(Outcome::Match) << ",\n";
  out << indent << "  \"total\": " << report.results.size() << ",\n";

  // Matches are summarized by count; only failing paths are listed
  out << indent << "  \"mismatches\": [";
  bool first = true;
  for (const auto &r : report.results) {
    if (r.outcome == Outcome::Match)
      continue;
    out << (first ? "\n" : ",\n");
    first = false;
    out << indent << "    {\"path\": " << quoted(r.relative)
        << ", \"outcome\": " << quoted(outcome_to_string(r.outcome));
    if (r.missing_from) {
      out << ", \"missing_from\": " << quoted(side_to_string(*r.missing_from));
    }
    out << ", \"source_size\": " << r.source_size
        << ", \"destination_size\": " << r.destination_size;
    if (!r.source_digest.empty()) {
      out << ", \"source_sha256\": " << quoted(r.source_digest);
    }
    if (!r.destination_digest.empty()) {
      out << ", \"destination_sha256\": " << quoted(r.destination_digest);
    }
    out << "}";
  }
  out << (first ? "]\n" : "\n" + indent + "  ]\n");
  out << indent << "}";
  return out.str();
}

std::string RunReport::to_json() const {
  std::ostringstream out;
  out << "{\n";
  out << "  \"state\": " << quoted(pipeline_state_to_string(state)) << ",\n";
  if (state == PipelineState::Failed) {
    out << "  \"failure_kind\": "
        << quoted(failure_kind ? error_kind_to_string(*failure_kind)
                               : "Internal")
        << ",\n";
    out << "  \"message\": " << quoted(message) << ",\n";
    if (!detail.empty()) {
      out << "  \"detail\": " << quoted(detail) << ",\n";
    }
  }
  out << "  \"exit_code\": " << exit_code() << ",\n";
  out << "  \"started_at\": " << quoted(started_at) << ",\n";
  out << "  \"finished_at\": " << quoted(finished_at) << ",\n";
  out << "  \"source\": " << quoted(source_root.string()) << ",\n";
  out << "  \"profile\": " << quoted(profile) << ",\n";
  out << "  \"confidence\": " << confidence << ",\n";
  out << "  \"import_date\": " << quoted(import_date) << ",\n";

  if (route) {
    out << "  \"destination\": {\"kind\": "
        << quoted(destination_kind_to_string(route->kind))
        << ", \"root\": " << quoted(route->root.string())
        << ", \"reachability\": "
        << quoted(reachability_to_string(route->reachability.state))
        << ", \"probe_detail\": " << quoted(route->reachability.detail)
        << "},\n";
  } else {
    out << "  \"destination\": null,\n";
  }
  out << "  \"day_folder\": " << quoted(day_folder.string()) << ",\n";

  out << "  \"transfer\": {\"attempts\": " << transfer_attempts
      << ", \"total\": " << transfer.total << ", \"copied\": "
      << transfer.copied << ", \"skipped\": " << transfer.skipped
      << ", \"bytes\": " << transfer.bytes
      << ", \"files_written\": " << files_written
      << ", \"bytes_written\": " << bytes_written << "},\n";

  out << "  \"verification\": ";
  if (verification) {
    out << verification_to_json(*verification, "  ");
  } else {
    out << "null";
  }
  out << ",\n";

  out << "  \"cleanup\": {\"performed\": "
      << (cleanup_performed ? "true" : "false")
      << ", \"deleted\": " << deleted
      << ", \"audit\": " << quoted(audit_path.string()) << "},\n";

  out << "  \"warnings\": [";
  for (size_t i = 0; i < warnings.size(); ++i) {
    out << quoted(warnings[i]);
    if (i < warnings.size() - 1)
      out << ", ";
  }
  out << "],\n";

  out << "  \"transitions\": [";
  for (size_t i = 0; i < transitions.size(); ++i) {
    out << "\n    {\"state\": "
        << quoted(pipeline_state_to_string(transitions[i].state))
        << ", \"at\": " << quoted(transitions[i].at) << "}";
    if (i < transitions.size() - 1)
      out << ",";
  }
  out << (transitions.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";
  return out.str();
}

bool RunReport::save(const fs::path &path) const {
  if (path.has_parent_path()) {
    ensure_dir_exists(path.parent_path());
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Failed to save run report to " + path.string());
    return false;
  }
  file << to_json();
  return static_cast<bool>(file);
}

} // namespace offload
