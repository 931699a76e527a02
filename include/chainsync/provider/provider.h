// CHAINSYNC - Chain Data Provider Interface
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// The capability set the sync engine depends on. BitcoinCoreProvider is the
// node-socket implementation; other wire protocols implement the same
// interface.

#ifndef CHAINSYNC_PROVIDER_PROVIDER_H
#define CHAINSYNC_PROVIDER_PROVIDER_H

#include <chainsync/provider/transaction.h>
#include <chainsync/rpc/json.h>
#include <chainsync/util/signal.h>

#include <future>
#include <string>

namespace chainsync {
namespace provider {

/// Request socket lifecycle
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closed
};

const char* ConnectionStateToString(ConnectionState state);

struct ConnectOptions {
    bool reconnect{false};  // reset the attempt counter before connecting
};

class ChainProvider {
public:
    virtual ~ChainProvider() = default;

    /**
     * Open the request connection, retrying at a fixed interval.
     * Throws ConnectionError once the attempt cap is exceeded.
     */
    virtual void Connect(const ConnectOptions& opts = ConnectOptions{}) = 0;

    /// Issue a raw call. Failures are delivered through the future.
    virtual std::future<rpc::JSONValue> Rpc(const std::string& method,
                                            const rpc::JSONValue& params) = 0;

    /// Blocking form of Rpc(); rethrows the call's failure
    rpc::JSONValue Call(const std::string& method,
                        const rpc::JSONValue& params = rpc::JSONValue(rpc::JSONValue::Array{})) {
        return Rpc(method, params).get();
    }

    virtual DecoratedTransaction GetTransaction(const std::string& txid,
                                                const TxFetchOptions& opts = TxFetchOptions{}) = 0;
    virtual TxHistory GetAddressHistory(const std::string& address,
                                        const TxFetchOptions& opts = TxFetchOptions{}) = 0;
    virtual AddressBalance GetBalance(const std::string& address) = 0;

    /// Returns the txid accepted by the node
    virtual std::string BroadcastTransaction(const std::string& rawHex) = 0;

    virtual void SubscribeToBlocks() = 0;
    virtual void UnsubscribeFromBlocks() = 0;

    /// Returns the subscription handle used in TransactionEvent::matchedAddress
    virtual std::string SubscribeToAddress(const std::string& address) = 0;
    virtual bool UnsubscribeFromAddress(const std::string& address) = 0;

    virtual bool IsConnected() const = 0;

    /// Tear down every transport; pending and later calls fail as closed
    virtual void Close() = 0;

    // ========================================================================
    // Notification Channels
    // ========================================================================

    util::Signal<const BlockEvent&>& NewBlocks() { return newBlocks_; }
    util::Signal<const TransactionEvent&>& NewTransactions() { return newTransactions_; }

    /// Advisory events: malformed lines, unmatched ids, handler failures
    util::Signal<const std::string&>& ClientErrors() { return clientErrors_; }

    /// Subscription pushes: (method, last param)
    util::Signal<const std::string&, const rpc::JSONValue&>& Notifications() { return notifications_; }

protected:
    void DisconnectAllSlots() {
        newBlocks_.DisconnectAll();
        newTransactions_.DisconnectAll();
        clientErrors_.DisconnectAll();
        notifications_.DisconnectAll();
    }

    util::Signal<const BlockEvent&> newBlocks_;
    util::Signal<const TransactionEvent&> newTransactions_;
    util::Signal<const std::string&> clientErrors_;
    util::Signal<const std::string&, const rpc::JSONValue&> notifications_;
};

} // namespace provider
} // namespace chainsync

#endif // CHAINSYNC_PROVIDER_PROVIDER_H
