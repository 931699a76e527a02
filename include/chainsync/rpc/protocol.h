// CHAINSYNC - Node RPC Framing
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Request framing for the node's JSON-RPC interface and the inbound
// framer that turns raw socket reads into discrete JSON lines.

#ifndef CHAINSYNC_RPC_PROTOCOL_H
#define CHAINSYNC_RPC_PROTOCOL_H

#include <chainsync/rpc/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chainsync {
namespace rpc {

/// Protocol version marker carried in every request
constexpr const char* JSONRPC_VERSION = "1.0";

/// Suffix of methods that carry subscription pushes
constexpr const char* SUBSCRIBE_SUFFIX = ".subscribe";

// ============================================================================
// Outbound
// ============================================================================

/// "<millis>-<random hex>" request id
std::string GenerateRequestId();

/// {"jsonrpc":"1.0","id":...,"method":...,"params":[...]}
std::string BuildRequestPayload(const std::string& method,
                                const JSONValue& params,
                                const std::string& id);

/// Standard base64 with padding
std::string Base64Encode(const std::string& input);

struct HttpCredentials {
    std::string host;
    uint16_t port{0};
    std::string user;
    std::string password;
};

/// Wrap a payload in a keep-alive POST carrying basic auth
std::string BuildHttpRequest(const HttpCredentials& creds, const std::string& body);

/// True if method names a subscription push
bool IsSubscriptionMethod(const std::string& method);

// ============================================================================
// Inbound
// ============================================================================

struct InboundLine {
    bool isStatus{false};   // HTTP status line rather than a JSON body
    int statusCode{0};
    std::string text;
};

/**
 * Splits a byte stream into lines. HTTP status lines are surfaced with
 * their code; header blocks are consumed; a body with Content-Length is
 * read exactly and then split on newlines. Empty lines are dropped.
 */
class ResponseStream {
public:
    std::vector<InboundLine> Feed(const std::string& chunk);

    /// Bytes buffered waiting for a line terminator or body end
    size_t Buffered() const { return buffer_.size(); }

    void Reset();

private:
    enum class State { Idle, Headers, Body };

    void EmitBody(const std::string& body, std::vector<InboundLine>& out);

    std::string buffer_;
    State state_{State::Idle};
    std::optional<size_t> contentLength_;
};

} // namespace rpc
} // namespace chainsync

#endif // CHAINSYNC_RPC_PROTOCOL_H
