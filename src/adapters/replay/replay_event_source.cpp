// File: src/adapters/replay/replay_event_source.cpp
#include "sx/adapters/replay/replay_event_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace sx {
namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> split_csv(const std::string& line) {
  std::vector<std::string> out;
  std::stringstream ss(line);
  std::string field;
  while (std::getline(ss, field, ',')) out.push_back(trim(field));
  return out;
}

bool parse_double(const std::string& s, double* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool fits_int32(double v) {
  return v >= static_cast<double>(std::numeric_limits<std::int32_t>::min()) &&
         v <= static_cast<double>(std::numeric_limits<std::int32_t>::max());
}

Status line_error(std::size_t line_no, const std::string& what) {
  return Status::parse_error("replay line " + std::to_string(line_no) + ": " + what);
}

void sort_by_time(std::vector<InteractionEvent>* events) {
  std::stable_sort(events->begin(), events->end(),
                   [](const InteractionEvent& a, const InteractionEvent& b) {
                     return a.timestamp < b.timestamp;
                   });
}

}  // namespace

ReplayEventSource::ReplayEventSource(ReplayEventSourceConfig cfg) : cfg_(std::move(cfg)) {}

ReplayEventSource::ReplayEventSource(std::vector<InteractionEvent> events, double tick_s)
    : from_file_(false), events_(std::move(events)) {
  cfg_.tick_s = tick_s;
  sort_by_time(&events_);
  rewind();
}

Result<std::vector<InteractionEvent>> ReplayEventSource::parse(std::istream& in) {
  using R = Result<std::vector<InteractionEvent>>;

  std::vector<InteractionEvent> events;
  std::string raw;
  std::size_t line_no = 0;
  bool seen_data = false;

  while (std::getline(in, raw)) {
    ++line_no;
    const std::string line = trim(raw);
    if (line.empty() || line[0] == '#') continue;

    const auto f = split_csv(line);
    if (!seen_data && !f.empty() && f[0] == "timestamp") {
      seen_data = true;  // header
      continue;
    }
    seen_data = true;

    if (f.size() < 2 || f.size() > 4) {
      return R::err(line_error(line_no, "expected 2 to 4 fields, got " + std::to_string(f.size())));
    }

    InteractionEvent e;
    if (!parse_double(f[0], &e.timestamp)) {
      return R::err(line_error(line_no, "bad timestamp '" + f[0] + "'"));
    }
    if (!parse_event_kind(f[1], &e.kind)) {
      return R::err(line_error(line_no, "unknown kind '" + f[1] + "'"));
    }

    double a = 0.0;
    double b = 0.0;
    const bool has_a = f.size() >= 3 && !f[2].empty();
    const bool has_b = f.size() >= 4 && !f[3].empty();
    if (has_a && !parse_double(f[2], &a)) return R::err(line_error(line_no, "bad field a '" + f[2] + "'"));
    if (has_b && !parse_double(f[3], &b)) return R::err(line_error(line_no, "bad field b '" + f[3] + "'"));

    switch (e.kind) {
      case EventKind::kMouseMove:
      case EventKind::kMouseClick:
      case EventKind::kMouseScroll:
        if (!fits_int32(a) || !fits_int32(b)) {
          return R::err(line_error(line_no, "mouse position out of range"));
        }
        e.x = static_cast<std::int32_t>(a);
        e.y = static_cast<std::int32_t>(b);
        break;
      case EventKind::kIdlePeriod:
      case EventKind::kIdleEnd:
        if (a < 0.0) return R::err(line_error(line_no, "negative idle duration"));
        e.duration = a;
        break;
      case EventKind::kFocusLost:
      case EventKind::kFocusGained:
        e.focus_lost = has_a ? (a != 0.0) : (e.kind == EventKind::kFocusLost);
        break;
      case EventKind::kKeyPress:
      case EventKind::kKeyRelease:
        break;
    }

    events.push_back(e);
  }

  if (in.bad()) return R::err(Status::io_error("replay: read failed"));
  return R::ok(std::move(events));
}

Result<std::vector<InteractionEvent>> ReplayEventSource::parse_string(const std::string& text) {
  std::istringstream in(text);
  return parse(in);
}

Status ReplayEventSource::start() {
  if (cfg_.tick_s <= 0.0) return Status::invalid_argument("ReplayEventSource: tick_s must be > 0");
  if (!from_file_) {
    rewind();
    return Status::ok_status();
  }

  if (cfg_.path.empty()) return Status::invalid_argument("ReplayEventSource: path is empty");

  std::error_code ec;
  if (!std::filesystem::is_regular_file(cfg_.path, ec)) {
    return Status::not_found("ReplayEventSource: file not found: " + cfg_.path);
  }

  std::ifstream f(cfg_.path);
  if (!f.is_open()) return Status::io_error("ReplayEventSource: failed to open " + cfg_.path);

  auto parsed = parse(f);
  if (!parsed.ok()) {
    return Status(parsed.status().code(), cfg_.path + ": " + parsed.status().message());
  }

  events_ = parsed.take_value();
  sort_by_time(&events_);
  rewind();
  return Status::ok_status();
}

void ReplayEventSource::stop() {}

void ReplayEventSource::rewind() {
  idx_ = 0;
  cursor_ = events_.empty() ? 0.0 : events_.front().timestamp;
}

Status ReplayEventSource::poll(double /*timeout_s*/, std::vector<InteractionEvent>* out) {
  if (!out) return Status::invalid_argument("ReplayEventSource::poll: out is null");
  if (idx_ >= events_.size()) return Status::out_of_range("eof");

  cursor_ += cfg_.tick_s;
  while (idx_ < events_.size() && events_[idx_].timestamp <= cursor_) {
    out->push_back(events_[idx_]);
    ++idx_;
  }
  return Status::ok_status();
}

}  // namespace sx
