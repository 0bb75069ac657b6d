#pragma once
#include <stdexcept>
#include <string>

namespace astream::core
{
/** Base of every error raised by the streaming transport. */
class StreamError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** Invalid chunk / overlap / queue parameters, rejected before a session. */
class ConfigError : public StreamError
{
public:
    explicit ConfigError(const std::string& what)
        : StreamError("config: " + what) {}
};

/** Malformed frame or header, sequence gap or repeat. Fatal for the session. */
class ProtocolError : public StreamError
{
public:
    explicit ProtocolError(const std::string& what)
        : StreamError("protocol: " + what) {}
};

/** Connection failure during read / write / connect. Never retried. */
class TransportError : public StreamError
{
public:
    explicit TransportError(const std::string& what)
        : StreamError("transport: " + what) {}
};

/** Encode / decode failure on one unit. Fatal for the session. */
class CodecError : public StreamError
{
public:
    explicit CodecError(const std::string& what)
        : StreamError("codec: " + what) {}
};

} // namespace astream::core
