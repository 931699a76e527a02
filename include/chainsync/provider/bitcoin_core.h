// CHAINSYNC - Bitcoin Core Provider
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// ChainProvider speaking Bitcoin Core JSON-RPC over a keep-alive request
// socket, with block and raw-transaction notifications from the node's
// ZeroMQ publisher.
//
// Threads:
// - reader: consumes the request socket and resolves pending calls
// - event loop: polls the event socket while any feed is active
// - pool: runs event handlers, reconnect attempts and the cache sweep
//
// Close() must not be called from a provider callback.

#ifndef CHAINSYNC_PROVIDER_BITCOIN_CORE_H
#define CHAINSYNC_PROVIDER_BITCOIN_CORE_H

#include <chainsync/db/database.h>
#include <chainsync/net/event_socket.h>
#include <chainsync/net/socket.h>
#include <chainsync/provider/cache.h>
#include <chainsync/provider/provider.h>
#include <chainsync/rpc/protocol.h>
#include <chainsync/util/threadpool.h>
#include <chainsync/util/time.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chainsync {

namespace util {
class ConfigManager;
}

namespace provider {

class BitcoinCoreProvider : public ChainProvider {
public:
    struct Config {
        std::string host{"127.0.0.1"};
        uint16_t port{18443};
        std::string user{"user"};
        std::string password{"password"};
        uint16_t zmqPort{28334};
        std::string eventEndpoint;                     // empty = tcp://host:zmqPort
        int maxReconnectAttempts{10};
        util::Milliseconds reconnectInterval{2000};
        util::Milliseconds eventPollInterval{200};     // bound on event loop shutdown latency
        size_t workerThreads{4};
        ResponseCache::Config cache;
    };

    explicit BitcoinCoreProvider(const Config& config,
                                 net::StreamSocketFactory socketFactory = net::MakeTcpSocket,
                                 net::EventSocketFactory eventFactory = nullptr,
                                 std::unique_ptr<db::Database> cacheStore = nullptr);
    ~BitcoinCoreProvider() override;

    BitcoinCoreProvider(const BitcoinCoreProvider&) = delete;
    BitcoinCoreProvider& operator=(const BitcoinCoreProvider&) = delete;

    // ========================================================================
    // ChainProvider
    // ========================================================================

    void Connect(const ConnectOptions& opts = ConnectOptions{}) override;
    std::future<rpc::JSONValue> Rpc(const std::string& method,
                                    const rpc::JSONValue& params) override;

    DecoratedTransaction GetTransaction(const std::string& txid,
                                        const TxFetchOptions& opts = TxFetchOptions{}) override;
    TxHistory GetAddressHistory(const std::string& address,
                                const TxFetchOptions& opts = TxFetchOptions{}) override;
    AddressBalance GetBalance(const std::string& address) override;
    std::string BroadcastTransaction(const std::string& rawHex) override;

    void SubscribeToBlocks() override;
    void UnsubscribeFromBlocks() override;
    std::string SubscribeToAddress(const std::string& address) override;
    bool UnsubscribeFromAddress(const std::string& address) override;

    bool IsConnected() const override;
    void Close() override;

    // ========================================================================
    // Node Helpers
    // ========================================================================

    /// "pong" when the node answers
    std::string Ping();

    /// Height used to turn confirmations into a block height
    Height GetBlockHeight() const { return blockHeight_.load(); }
    void SetBlockHeight(Height height) { blockHeight_.store(height); }

    /// Query getblockcount and track the result
    Height RefreshBlockHeight();

    // ========================================================================
    // Introspection
    // ========================================================================

    ConnectionState GetState() const { return state_.load(); }
    size_t PendingRequests() const;
    int ReconnectAttempts() const { return attempts_.load(); }
    bool IsEventSocketOpen() const;
    std::vector<std::string> WatchedAddresses() const;
    const Config& GetConfig() const { return config_; }
    ResponseCache& Cache() { return cache_; }

private:
    struct PendingRequest {
        std::shared_ptr<std::promise<rpc::JSONValue>> promise;
        std::string method;
    };

    // Request socket
    void OpenConnection();
    void ReaderLoop(net::StreamSocket* socket);
    void OnSocketClosed(net::StreamSocket* socket);
    void ScheduleReconnect(const std::string& lastError);
    void ReconnectAttempt(const std::string& lastError);
    void HandleLine(const rpc::InboundLine& line);
    bool TakePending(const std::string& id, PendingRequest& out);
    void FailAllPending(const std::exception_ptr& error);
    void Advisory(const std::string& message);

    // Transactions
    rpc::JSONValue FetchRawTransaction(const std::string& txid, const TxFetchOptions& opts);
    TxOutput ProcessVout(const rpc::JSONValue& vout, const std::string& txid, Height height) const;

    // Event socket
    std::string EventEndpoint() const;
    void EnsureEventSocketLocked();
    void MaybeReleaseEventSocketLocked();
    void EventLoop(net::EventSocket* socket);
    void HandleBlockEvent(const std::string& hashHex);
    void HandleRawTxEvent(const std::string& txHex);

    Config config_;
    net::StreamSocketFactory socketFactory_;
    net::EventSocketFactory eventFactory_;

    util::ThreadPool pool_;
    util::Scheduler scheduler_;
    ResponseCache cache_;

    // Connection
    mutable std::mutex connMutex_;
    std::condition_variable closeCv_;
    std::unique_ptr<net::StreamSocket> socket_;
    std::thread reader_;
    rpc::ResponseStream framer_;      // reader thread only
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> closed_{false};
    std::atomic<int> attempts_{0};
    uint64_t reconnectTask_{0};

    // Pending requests
    mutable std::mutex pendingMutex_;
    std::map<std::string, PendingRequest> pending_;

    // Event feeds
    mutable std::mutex eventMutex_;
    std::unique_ptr<net::EventSocket> eventSocket_;
    std::thread eventThread_;
    std::atomic<bool> eventStop_{false};
    bool blocksSubscribed_{false};
    bool rawTxSubscribed_{false};
    std::vector<std::string> watchList_;

    std::atomic<Height> blockHeight_{0};
};

/// Map rpc*/zmqport/reconnect*/cache* keys onto a provider Config
BitcoinCoreProvider::Config ProviderConfigFromSettings(const util::ConfigManager& settings);

} // namespace provider
} // namespace chainsync

#endif // CHAINSYNC_PROVIDER_BITCOIN_CORE_H
