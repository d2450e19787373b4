// File: src/core/events/jsonl_event_sink.cpp
#include "sx/core/events/jsonl_event_sink.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "sx/core/util/session_id.hpp"

namespace sx {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

// events_<session>_<wall_ns>.jsonl -> wall_ns, or -1 if the name is not a run file.
std::int64_t parse_run_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "events_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "events_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string stem = name.substr(0, name.size() - suffix.size());
  const auto us = stem.rfind('_');
  if (us == std::string::npos || us + 1 >= stem.size()) return -1;

  const std::string digits = stem.substr(us + 1);
  if (!is_digits(digits) || digits.size() > 18) return -1;
  return std::stoll(digits);
}

}  // namespace

const char* severity_name(Severity s) noexcept {
  switch (s) {
    case Severity::kInfo: return "info";
    case Severity::kWarning: return "warning";
    case Severity::kError: return "error";
  }
  return "info";
}

JsonlEventSink::JsonlEventSink(std::size_t keep_runs, bool write_latest)
    : keep_runs_(keep_runs), write_latest_(write_latest) {}

JsonlEventSink::~JsonlEventSink() { close(); }

void JsonlEventSink::prune_out_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::int64_t k = parse_run_epoch_ns_from_name(it.path().filename().string());
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  // Prune before creating ours so the new file always survives.
  if (keep_runs_ > 0) prune_out_dir(run.out_dir, keep_runs_ - 1);

  path_ = join_path(run.out_dir,
                    "events_" + run.session_id + "_" + std::to_string(run.wall_start_ns) + ".jsonl");
  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  if (write_latest_) {
    latest_path_ = join_path(run.out_dir, "events_latest.jsonl");
    latest_.open(latest_path_, std::ios::out | std::ios::trunc);
    if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");
  } else {
    latest_path_.clear();
  }

  open_ = true;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_s\":" << run.start_time << ","
     << "\"t_wall_ns\":" << run.wall_start_ns << ","
     << "\"t_wall_s\":" << ns_to_s(run.wall_start_ns) << ","
     << "\"session_id\":\"" << json_escape(run.session_id) << "\","
     << "\"source\":\"" << json_escape(run.source) << "\","
     << "\"config_path\":\"" << json_escape(run.config_path) << "\","
     << "\"config_hash\":\"" << run.config_hash << "\""
     << "}";

  SX_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlEventSink::emit(const TelemetryEvent& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":\"" << json_escape(e.type) << "\","
     << "\"severity\":\"" << severity_name(e.severity) << "\","
     << "\"t_s\":" << e.t << ","
     << "\"t_wall_ns\":" << e.t_wall_ns << ","
     << "\"t_wall_s\":" << ns_to_s(e.t_wall_ns);

  for (const auto& [key, value] : e.fields) {
    ss << ",\"" << json_escape(key) << "\":" << value;
  }

  if (!e.message.empty()) {
    ss << ",\"message\":\"" << json_escape(e.message) << "\"";
  }

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");

  if (write_latest_) {
    latest_ << line << "\n";
    if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");
  }

  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");

  if (write_latest_) {
    latest_.flush();
    if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");
  }

  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace sx
