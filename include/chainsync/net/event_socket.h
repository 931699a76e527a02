// CHAINSYNC - Event Transport
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// One-way publish/subscribe transport carrying node notifications.
// Payloads are delivered as lowercase hex strings.

#ifndef CHAINSYNC_NET_EVENT_SOCKET_H
#define CHAINSYNC_NET_EVENT_SOCKET_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace chainsync {
namespace net {

/// Topic published for each new block hash
constexpr const char* TOPIC_HASHBLOCK = "hashblock";

/// Topic published for each raw transaction entering the mempool or a block
constexpr const char* TOPIC_RAWTX = "rawtx";

struct EventMessage {
    std::string topic;
    std::string payloadHex;
};

class EventSocket {
public:
    virtual ~EventSocket() = default;

    /// Connect to an endpoint such as "tcp://127.0.0.1:28334"
    virtual void Connect(const std::string& endpoint) = 0;

    virtual void Subscribe(const std::string& topic) = 0;
    virtual void Unsubscribe(const std::string& topic) = 0;

    /**
     * Wait up to timeout for one message.
     * @return nullopt on timeout or after Close()
     */
    virtual std::optional<EventMessage> Receive(std::chrono::milliseconds timeout) = 0;

    virtual void Close() = 0;
};

using EventSocketFactory = std::function<std::unique_ptr<EventSocket>()>;

/// Lowercase hex encoding of raw bytes
std::string HexStr(const std::string& bytes);

} // namespace net
} // namespace chainsync

#endif // CHAINSYNC_NET_EVENT_SOCKET_H
