#pragma once
#include <string>
#include "task.hpp"

Timestamp now_micros();
// YYYY-MM-DDTHH:MM:SS.ffffffZ
std::string format_iso8601(Timestamp ts);
// Accepts an optional fraction; only the Z suffix is supported.
Timestamp parse_iso8601(const std::string& s);
