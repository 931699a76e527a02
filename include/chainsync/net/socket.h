// CHAINSYNC - Request Transport
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Bidirectional byte stream used for node RPC traffic.

#ifndef CHAINSYNC_NET_SOCKET_H
#define CHAINSYNC_NET_SOCKET_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace chainsync {
namespace net {

// ============================================================================
// Stream Socket Interface
// ============================================================================

class StreamSocket {
public:
    virtual ~StreamSocket() = default;

    /// Open the connection; throws ConnectionError on failure
    virtual void Connect(const std::string& host, uint16_t port) = 0;

    /// Send all bytes; throws ConnectionError on failure
    virtual void Write(const std::string& data) = 0;

    /**
     * Block until data arrives.
     * @return The bytes read, or nullopt once the peer closed the stream or
     *         Close() was called
     */
    virtual std::optional<std::string> Read() = 0;

    /// Close the stream. Safe to call from any thread; wakes a blocked Read().
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;
};

using StreamSocketFactory = std::function<std::unique_ptr<StreamSocket>()>;

// ============================================================================
// TCP Implementation
// ============================================================================

class TcpSocket : public StreamSocket {
public:
    /// Read buffer size per recv() call
    static constexpr size_t READ_CHUNK = 16384;

    TcpSocket();
    ~TcpSocket() override;

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    void Connect(const std::string& host, uint16_t port) override;
    void Write(const std::string& data) override;
    std::optional<std::string> Read() override;
    void Close() override;
    bool IsOpen() const override { return open_.load(); }

private:
    int fd_{-1};
    std::atomic<bool> open_{false};
    std::mutex writeMutex_;
};

/// Default factory for the provider's request socket
std::unique_ptr<StreamSocket> MakeTcpSocket();

} // namespace net
} // namespace chainsync

#endif // CHAINSYNC_NET_SOCKET_H
