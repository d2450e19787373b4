// File: src/core/types.cpp
#include "sx/core/status.hpp"
#include "sx/core/types.hpp"

#include <array>
#include <utility>

namespace sx {
namespace {

constexpr std::array<std::pair<EventKind, const char*>, 9> kKindNames = {{
    {EventKind::kKeyPress, "key_press"},
    {EventKind::kKeyRelease, "key_release"},
    {EventKind::kMouseMove, "mouse_move"},
    {EventKind::kMouseClick, "mouse_click"},
    {EventKind::kMouseScroll, "mouse_scroll"},
    {EventKind::kFocusLost, "focus_lost"},
    {EventKind::kFocusGained, "focus_gained"},
    {EventKind::kIdlePeriod, "idle_period"},
    {EventKind::kIdleEnd, "idle_end"},
}};

}  // namespace

const char* event_kind_name(EventKind kind) noexcept {
  for (const auto& [k, name] : kKindNames) {
    if (k == kind) return name;
  }
  return "unknown";
}

bool parse_event_kind(const std::string& name, EventKind* out) {
  for (const auto& [k, n] : kKindNames) {
    if (name == n) {
      if (out) *out = k;
      return true;
    }
  }
  return false;
}

const char* status_code_name(Status::Code code) noexcept {
  switch (code) {
    case Status::Code::kOk: return "ok";
    case Status::Code::kInvalidArgument: return "invalid_argument";
    case Status::Code::kOutOfRange: return "out_of_range";
    case Status::Code::kNotFound: return "not_found";
    case Status::Code::kIoError: return "io_error";
    case Status::Code::kUnavailable: return "unavailable";
    case Status::Code::kTimeout: return "timeout";
    case Status::Code::kParseError: return "parse_error";
    case Status::Code::kUnsupported: return "unsupported";
    case Status::Code::kInternal: return "internal";
  }
  return "unknown";
}

}  // namespace sx
