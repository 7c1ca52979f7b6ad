#pragma once

#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"

bool is_valid_utf8(absl::string_view text);

// Number of code points, assumes valid UTF-8.
size_t code_point_length(absl::string_view text);

// Locale independent Unicode lowercasing. Invalid bytes become U+FFFD.
std::string to_lower(absl::string_view text);
