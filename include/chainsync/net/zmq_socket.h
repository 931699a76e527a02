// CHAINSYNC - ZeroMQ Event Transport
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// SUB socket reading the node's zmqpub* notifications. Each notification is
// a multipart message: topic, body, 4-byte sequence number.

#ifndef CHAINSYNC_NET_ZMQ_SOCKET_H
#define CHAINSYNC_NET_ZMQ_SOCKET_H

#include <chainsync/net/event_socket.h>

#include <mutex>

namespace chainsync {
namespace net {

class ZmqEventSocket : public EventSocket {
public:
    ZmqEventSocket();
    ~ZmqEventSocket() override;

    ZmqEventSocket(const ZmqEventSocket&) = delete;
    ZmqEventSocket& operator=(const ZmqEventSocket&) = delete;

    void Connect(const std::string& endpoint) override;
    void Subscribe(const std::string& topic) override;
    void Unsubscribe(const std::string& topic) override;
    std::optional<EventMessage> Receive(std::chrono::milliseconds timeout) override;
    void Close() override;

private:
    void SetOption(int option, const std::string& value);

    std::mutex mutex_;
    void* context_{nullptr};
    void* socket_{nullptr};
};

/// Factory producing ZeroMQ SUB sockets for the provider
EventSocketFactory MakeZmqEventSocketFactory();

} // namespace net
} // namespace chainsync

#endif // CHAINSYNC_NET_ZMQ_SOCKET_H
