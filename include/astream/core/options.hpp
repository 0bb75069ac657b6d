#pragma once
#include "core/config.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace astream::core
{
using Options = std::unordered_map<std::string, std::string>;

/**
 *  `--key value` pairs from argv[first, argc), plus the bare flags
 *  --realtime and --verbose. Throws ConfigError.
 */
[[nodiscard]] Options parse_options(int argc, const char* const* argv, int first);

/** Unsigned option in [0, max], `fallback` when absent. Throws ConfigError
 *  on text that is not a number or a value out of range. */
[[nodiscard]] uint64_t number_option(const Options& opts, const std::string& key,
                                     uint64_t fallback, uint64_t max);

/** StreamConfig filled from `opts` and validated. */
[[nodiscard]] StreamConfig make_config(const Options& opts);

} // namespace astream::core
