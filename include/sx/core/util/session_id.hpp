// File: include/sx/core/util/session_id.hpp
#pragma once

#include <string>

#include "sx/core/types.hpp"

namespace sx {

// Random UUID v4 text ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
// Not derived from anything about the user or machine.
SessionId generate_session_id();

// Escapes a string for embedding in a JSON string literal.
std::string json_escape(const std::string& s);

}  // namespace sx
