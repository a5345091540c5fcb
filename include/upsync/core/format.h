#pragma once

// Compatibility header for std::format
// Uses std::format when available, falls back to fmt library

#if UPSYNC_HAS_STD_FORMAT
#include <format>
namespace upsync {
using std::format;
using std::format_to;
using std::vformat;
} // namespace upsync
#else
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace upsync {
// Map fmt functions to std::format interface
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace upsync
#endif
