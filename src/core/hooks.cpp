// core/hooks.cpp - External collaborators implementation
#include "hooks.hpp"
#include "../utils.hpp"
#include <sstream>

namespace offload {

std::string describe_summary(const RunSummary &summary) {
  std::ostringstream out;
  out << "Camera:      " << summary.profile << "\n";
  out << "Files:       " << summary.file_count << " ("
      << format_size(summary.total_bytes) << ")\n";
  out << "Import date: " << summary.import_date << "\n";
  out << "Day-folder:  " << summary.day_folder.string() << "\n";
  return out.str();
}

std::string CommandNotifier::build_command(const RunReport &report) const {
  std::string kind;
  if (report.state == PipelineState::Failed) {
    kind = report.failure_kind ? error_kind_to_string(*report.failure_kind)
                               : "Internal";
  }
  std::string message = report.message;
  if (report.succeeded()) {
    message = std::to_string(report.transfer.total) + " files offloaded";
    if (!report.warnings.empty()) {
      message += ", " + std::to_string(report.warnings.size()) + " warnings";
    }
  }

  std::string cmd;
  cmd += "export OFFLOAD_STATE=" +
         shell_quote(pipeline_state_to_string(report.state)) + "; ";
  cmd += "export OFFLOAD_KIND=" + shell_quote(kind) + "; ";
  cmd += "export OFFLOAD_MESSAGE=" + shell_quote(message) + "; ";
  cmd += "export OFFLOAD_PROFILE=" + shell_quote(report.profile) + "; ";
  cmd += "export OFFLOAD_DESTINATION=" +
         shell_quote(report.day_folder.string()) + "; ";
  cmd += command_;
  return cmd;
}

bool CommandNotifier::notify(const RunReport &report) {
  if (command_.empty()) {
    return true;
  }

  std::string output;
  int status = run_capture(build_command(report) + " 2>&1", output);
  if (status != 0) {
    LOG_WARN("Notification command exited with " + std::to_string(status) +
             ": " + trim(output, " \t\r\n"));
    return false;
  }
  LOG_DEBUG("Notification delivered");
  return true;
}

bool TerminalConfirmationGate::confirm(const RunSummary &summary) {
  out_ << describe_summary(summary);
  out_ << "Proceed with offload? [y/N] " << std::flush;

  std::string answer;
  if (!std::getline(in_, answer)) {
    return false;
  }
  answer = to_lower(trim(answer, " \t\r"));
  return answer == "y" || answer == "yes";
}

} // namespace offload
