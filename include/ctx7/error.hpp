#pragma once
#include <stdexcept>
#include <string>

namespace ctx7 {

class Ctx7Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed JSON or a message that is not valid JSON-RPC.
class ParseError : public Ctx7Error {
public:
    using Ctx7Error::Ctx7Error;
};

class ProtocolError : public Ctx7Error {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : Ctx7Error(msg), code(code) {}
};

class TransportError : public Ctx7Error {
public:
    using Ctx7Error::Ctx7Error;
};

/// The documentation service could not be reached or answered garbage.
class RemoteError : public Ctx7Error {
public:
    using Ctx7Error::Ctx7Error;
};

/// Unrecoverable startup or serving failure. The supervisor exits on it.
class FatalError : public Ctx7Error {
public:
    using Ctx7Error::Ctx7Error;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace ctx7
