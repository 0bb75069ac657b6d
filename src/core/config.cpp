#include "core/config.hpp"
#include "core/errors.hpp"

#include <string>

namespace astream::core
{

void StreamConfig::validate() const
{
    if (chunk_length == 0)
        throw ConfigError("chunk_length must be > 0");

    if (overlap_length >= chunk_length)
        throw ConfigError("overlap_length (" + std::to_string(overlap_length)
                          + ") must be < chunk_length ("
                          + std::to_string(chunk_length) + ")");

    if (overlap_length > chunk_length - overlap_length)
        throw ConfigError("overlap_length must not exceed half of chunk_length");

    if (chunk_length > UINT32_MAX)
        throw ConfigError("chunk_length does not fit the wire format");

    if (queue_capacity == 0)
        throw ConfigError("queue_capacity must be > 0");

    if (rate_limit_enabled && rate_limit_bytes_per_second == 0)
        throw ConfigError("rate limit enabled with 0 bytes/s");

    if (sample_rate == 0)
        throw ConfigError("sample_rate must be > 0");

    if (quality_layers == 0)
        throw ConfigError("quality_layers must be > 0");

    if (io_timeout.count() < 0)
        throw ConfigError("io_timeout must be >= 0");
}

} // namespace astream::core
