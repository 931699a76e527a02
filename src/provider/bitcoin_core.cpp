// CHAINSYNC - Bitcoin Core Provider Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/provider/bitcoin_core.h>
#include <chainsync/core/errors.h>
#include <chainsync/core/reward.h>
#include <chainsync/util/config.h>
#include <chainsync/util/logging.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>

namespace chainsync {
namespace provider {

namespace LogCategory = util::LogCategory;

namespace {

/// Build a positional parameter array
template<typename... Args>
rpc::JSONValue Params(Args&&... args) {
    rpc::JSONValue::Array arr{rpc::JSONValue(std::forward<Args>(args))...};
    return rpc::JSONValue(std::move(arr));
}

util::ThreadPool::Config MakePoolConfig(const BitcoinCoreProvider::Config& config) {
    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = config.workerThreads;
    poolConfig.name = "provider";
    return poolConfig;
}

std::string TxCacheKey(const std::string& txid) {
    return "tx:" + txid;
}

/// Single address a scriptPubKey pays to, old and new node formats. Bare
/// multisig and other multi-address scripts have none.
std::optional<std::string> ScriptAddress(const rpc::JSONValue& scriptPubKey) {
    if (scriptPubKey["address"].IsString()) {
        return scriptPubKey["address"].GetString();
    }
    const rpc::JSONValue& legacy = scriptPubKey["addresses"];
    if (legacy.Size() == 1 && legacy[0].IsString()) {
        return legacy[0].GetString();
    }
    return std::nullopt;
}

} // namespace

const char* ConnectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Closed:       return "closed";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

BitcoinCoreProvider::BitcoinCoreProvider(const Config& config,
                                         net::StreamSocketFactory socketFactory,
                                         net::EventSocketFactory eventFactory,
                                         std::unique_ptr<db::Database> cacheStore)
    : config_(config)
    , socketFactory_(std::move(socketFactory))
    , eventFactory_(std::move(eventFactory))
    , pool_(MakePoolConfig(config))
    , scheduler_(pool_)
    , cache_(config.cache, &scheduler_, std::move(cacheStore)) {
    if (!socketFactory_) {
        throw std::invalid_argument("BitcoinCoreProvider requires a socket factory");
    }
    scheduler_.Start();
}

BitcoinCoreProvider::~BitcoinCoreProvider() {
    Close();
}

// ============================================================================
// Request Socket
// ============================================================================

void BitcoinCoreProvider::Connect(const ConnectOptions& opts) {
    if (closed_.load()) {
        throw ConnectionError::Closed();
    }
    if (opts.reconnect) {
        attempts_.store(0);
    }
    if (state_.load() == ConnectionState::Connected) {
        return;
    }

    std::string lastError;
    while (true) {
        state_.store(ConnectionState::Connecting);
        try {
            OpenConnection();
            attempts_.store(0);
            return;
        } catch (const ConnectionError& e) {
            lastError = e.what();
        }

        if (closed_.load()) {
            throw ConnectionError::Closed();
        }
        state_.store(ConnectionState::Disconnected);

        if (attempts_.load() >= config_.maxReconnectAttempts) {
            LOG_ERROR(LogCategory::PROVIDER) << "Giving up on " << config_.host << ":"
                                             << config_.port << " after "
                                             << attempts_.load() << " attempts";
            throw ConnectionError::GaveUp(lastError);
        }

        int attempt = ++attempts_;
        LOG_WARN(LogCategory::PROVIDER) << "Connect failed (" << lastError << "), retry "
                                        << attempt << "/" << config_.maxReconnectAttempts
                                        << " in " << config_.reconnectInterval.count() << "ms";

        std::unique_lock<std::mutex> lock(connMutex_);
        if (closeCv_.wait_for(lock, config_.reconnectInterval,
                              [this]() { return closed_.load(); })) {
            throw ConnectionError::Closed();
        }
    }
}

void BitcoinCoreProvider::OpenConnection() {
    std::unique_ptr<net::StreamSocket> socket = socketFactory_();
    socket->Connect(config_.host, config_.port);

    std::thread oldReader;
    std::unique_ptr<net::StreamSocket> oldSocket;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        if (closed_.load()) {
            socket->Close();
            throw ConnectionError::Closed();
        }
        oldReader = std::move(reader_);
        oldSocket = std::move(socket_);
    }

    // The previous reader sees a stale socket and exits without side effects
    if (oldSocket) {
        oldSocket->Close();
    }
    if (oldReader.joinable()) {
        oldReader.join();
    }

    {
        std::lock_guard<std::mutex> lock(connMutex_);
        if (closed_.load()) {
            socket->Close();
            throw ConnectionError::Closed();
        }
        framer_.Reset();
        net::StreamSocket* raw = socket.get();
        socket_ = std::move(socket);
        state_.store(ConnectionState::Connected);
        if (reconnectTask_ != 0) {
            scheduler_.Cancel(reconnectTask_);
            reconnectTask_ = 0;
        }
        reader_ = std::thread(&BitcoinCoreProvider::ReaderLoop, this, raw);
    }

    LOG_INFO(LogCategory::PROVIDER) << "Connected to node at " << config_.host << ":"
                                    << config_.port;
}

void BitcoinCoreProvider::ReaderLoop(net::StreamSocket* socket) {
    while (true) {
        std::optional<std::string> chunk;
        try {
            chunk = socket->Read();
        } catch (const ConnectionError& e) {
            LOG_DEBUG(LogCategory::RPC) << "Read failed: " << e.what();
            break;
        }
        if (!chunk) {
            break;
        }
        for (const auto& line : framer_.Feed(*chunk)) {
            HandleLine(line);
        }
    }
    OnSocketClosed(socket);
}

void BitcoinCoreProvider::OnSocketClosed(net::StreamSocket* socket) {
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        if (socket_.get() != socket || closed_.load()) {
            return;
        }
        state_.store(ConnectionState::Disconnected);
    }

    LOG_WARN(LogCategory::PROVIDER) << "Connection to " << config_.host << ":"
                                    << config_.port << " lost";
    FailAllPending(std::make_exception_ptr(ConnectionError("connection lost")));
    ScheduleReconnect("connection lost");
}

void BitcoinCoreProvider::ScheduleReconnect(const std::string& lastError) {
    std::lock_guard<std::mutex> lock(connMutex_);
    if (closed_.load()) {
        return;
    }
    reconnectTask_ = scheduler_.ScheduleAfter(config_.reconnectInterval,
        [this, lastError]() { ReconnectAttempt(lastError); });
}

void BitcoinCoreProvider::ReconnectAttempt(const std::string& lastError) {
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        if (closed_.load() || state_.load() == ConnectionState::Connected) {
            return;
        }
        reconnectTask_ = 0;
    }

    if (attempts_.load() >= config_.maxReconnectAttempts) {
        LOG_ERROR(LogCategory::PROVIDER) << "Giving up reconnecting after "
                                         << attempts_.load() << " attempts";
        Advisory(ConnectionError::GaveUp(lastError).what());
        return;
    }

    int attempt = ++attempts_;
    LOG_WARN(LogCategory::PROVIDER) << "Reconnecting, attempt " << attempt << "/"
                                    << config_.maxReconnectAttempts;
    try {
        OpenConnection();
        attempts_.store(0);
    } catch (const ConnectionError& e) {
        if (!closed_.load()) {
            ScheduleReconnect(e.what());
        }
    }
}

std::future<rpc::JSONValue> BitcoinCoreProvider::Rpc(const std::string& method,
                                                     const rpc::JSONValue& params) {
    auto promise = std::make_shared<std::promise<rpc::JSONValue>>();
    std::future<rpc::JSONValue> future = promise->get_future();

    std::lock_guard<std::mutex> lock(connMutex_);
    if (closed_.load()) {
        promise->set_exception(std::make_exception_ptr(ConnectionError::Closed()));
        return future;
    }
    if (state_.load() != ConnectionState::Connected || !socket_) {
        promise->set_exception(std::make_exception_ptr(ConnectionError::NotConnected()));
        return future;
    }

    std::string id = rpc::GenerateRequestId();
    {
        std::lock_guard<std::mutex> pendingLock(pendingMutex_);
        while (pending_.count(id) != 0) {
            id = rpc::GenerateRequestId();
        }
        pending_[id] = PendingRequest{promise, method};
    }

    rpc::HttpCredentials creds{config_.host, config_.port, config_.user, config_.password};
    std::string request = rpc::BuildHttpRequest(creds,
                                                rpc::BuildRequestPayload(method, params, id));

    LOG_TRACE(LogCategory::RPC) << "-> " << method << " [" << id << "]";
    try {
        socket_->Write(request);
    } catch (const ConnectionError&) {
        PendingRequest entry;
        if (TakePending(id, entry)) {
            entry.promise->set_exception(std::current_exception());
        }
    }
    return future;
}

void BitcoinCoreProvider::HandleLine(const rpc::InboundLine& line) {
    if (line.isStatus) {
        if (line.statusCode < 200 || line.statusCode >= 300) {
            Advisory("HTTP status: " + line.text);
        }
        return;
    }

    auto parsed = rpc::JSONValue::TryParse(line.text);
    if (!parsed || !parsed->IsObject()) {
        Advisory("malformed response: " + line.text);
        return;
    }

    const rpc::JSONValue& response = *parsed;
    const rpc::JSONValue& idValue = response["id"];
    std::string id = idValue.IsString() ? idValue.GetString() : idValue.ToJSON();
    const std::string& method = response["method"].GetString();

    try {
        if (rpc::IsSubscriptionMethod(method)) {
            PendingRequest entry;
            if (TakePending(id, entry)) {
                entry.promise->set_exception(std::make_exception_ptr(
                    ProtocolError("subscription push answered request " + id)));
            }
            const rpc::JSONValue& params = response["params"];
            rpc::JSONValue last = params.Size() > 0 ? params[params.Size() - 1] : rpc::JSONValue();
            notifications_.Emit(method, last);
            return;
        }

        PendingRequest entry;
        bool found = TakePending(id, entry);
        const rpc::JSONValue& error = response["error"];

        if (!error.IsNull()) {
            if (found) {
                LOG_DEBUG(LogCategory::RPC) << "<- " << entry.method << " error " << error.ToJSON();
                entry.promise->set_exception(std::make_exception_ptr(
                    RemoteError(error.ToJSON(), entry.method)));
            } else {
                Advisory("error for unknown response id: " + id + " - " + error.ToJSON());
            }
            return;
        }

        if (!found) {
            Advisory("no handler for response id: " + id);
            return;
        }

        LOG_TRACE(LogCategory::RPC) << "<- " << entry.method << " [" << id << "]";
        entry.promise->set_value(response["result"]);
    } catch (const std::exception& e) {
        Advisory(std::string("response handler failed: ") + e.what());
    }
}

bool BitcoinCoreProvider::TakePending(const std::string& id, PendingRequest& out) {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    out = std::move(it->second);
    pending_.erase(it);
    return true;
}

void BitcoinCoreProvider::FailAllPending(const std::exception_ptr& error) {
    std::map<std::string, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        failed.swap(pending_);
    }
    for (auto& [id, entry] : failed) {
        entry.promise->set_exception(error);
    }
}

size_t BitcoinCoreProvider::PendingRequests() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_.size();
}

void BitcoinCoreProvider::Advisory(const std::string& message) {
    LOG_WARN(LogCategory::RPC) << message;
    clientErrors_.Emit(message);
}

bool BitcoinCoreProvider::IsConnected() const {
    return state_.load() == ConnectionState::Connected;
}

void BitcoinCoreProvider::Close() {
    std::thread reader;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        if (closed_.exchange(true)) {
            return;
        }
        state_.store(ConnectionState::Closed);
        if (socket_) {
            socket_->Close();
        }
        if (reconnectTask_ != 0) {
            scheduler_.Cancel(reconnectTask_);
            reconnectTask_ = 0;
        }
        reader = std::move(reader_);
    }
    closeCv_.notify_all();

    LOG_INFO(LogCategory::PROVIDER) << "Closing provider for " << config_.host << ":"
                                    << config_.port;

    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        blocksSubscribed_ = false;
        rawTxSubscribed_ = false;
        watchList_.clear();
        MaybeReleaseEventSocketLocked();
    }

    if (reader.joinable()) {
        reader.join();
    }
    FailAllPending(std::make_exception_ptr(ConnectionError::Closed()));

    scheduler_.Stop();
    pool_.Shutdown();
    cache_.Stop();
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        socket_.reset();
    }
    DisconnectAllSlots();
}

// ============================================================================
// Node Helpers
// ============================================================================

std::string BitcoinCoreProvider::Ping() {
    rpc::JSONValue result = Call("ping");
    if (!result.IsNull()) {
        throw ProtocolError("unexpected ping result: " + result.ToJSON());
    }
    return "pong";
}

Height BitcoinCoreProvider::RefreshBlockHeight() {
    rpc::JSONValue result = Call("getblockcount");
    if (!result.IsInt()) {
        throw ProtocolError("unexpected getblockcount result: " + result.ToJSON());
    }
    SetBlockHeight(result.GetInt());
    return result.GetInt();
}

// ============================================================================
// Transactions
// ============================================================================

rpc::JSONValue BitcoinCoreProvider::FetchRawTransaction(const std::string& txid,
                                                        const TxFetchOptions& opts) {
    const std::string key = TxCacheKey(txid);
    if (opts.cache) {
        auto cached = cache_.Get(key);
        // Unconfirmed entries are refetched so the height can advance
        if (cached && (*cached)["height"].GetInt() != 0) {
            return *cached;
        }
    }

    rpc::JSONValue decoded;
    int64_t confirmations = 0;
    try {
        rpc::JSONValue wallet = Call("gettransaction", Params(txid, true, true));
        decoded = wallet["decoded"];
        confirmations = wallet["confirmations"].GetInt();
    } catch (const RemoteError& e) {
        LOG_DEBUG(LogCategory::PROVIDER) << "gettransaction " << txid
                                         << " failed, using getrawtransaction: " << e.what();
        decoded = Call("getrawtransaction", Params(txid, true));
        confirmations = decoded["confirmations"].GetInt();
    }

    if (!decoded.IsObject()) {
        throw ProtocolError("no decoded transaction for " + txid);
    }

    Height height = confirmations <= 0 ? 0 : GetBlockHeight() - (confirmations - 1);

    rpc::JSONValue entry;
    entry["tx"] = decoded;
    entry["height"] = static_cast<int64_t>(height);
    cache_.Set(key, entry);
    return entry;
}

TxOutput BitcoinCoreProvider::ProcessVout(const rpc::JSONValue& vout,
                                          const std::string& txid,
                                          Height height) const {
    TxOutput out;
    const rpc::JSONValue& spk = vout["scriptPubKey"];
    out.address = ScriptAddress(spk);
    out.value = AmountFromValue(vout["value"].GetDouble());
    out.scriptHex = spk["hex"].GetString();
    out.index = static_cast<uint32_t>(vout["n"].GetInt());
    out.txid = txid;
    out.height = height;
    return out;
}

DecoratedTransaction BitcoinCoreProvider::GetTransaction(const std::string& txid,
                                                         const TxFetchOptions& opts) {
    rpc::JSONValue entry = FetchRawTransaction(txid, opts);
    const rpc::JSONValue& tx = entry["tx"];

    DecoratedTransaction result;
    result.txid = txid;
    result.height = entry["height"].GetInt();

    Amount totalOut = 0;
    for (const auto& vout : tx["vout"].GetArray()) {
        TxOutput out = ProcessVout(vout, txid, result.height);
        bool standard = out.address.has_value();
        if (standard) {
            totalOut += out.value;
        }
        result.outputs.push_back(std::move(out));
        result.standardOutputs.push_back(standard);
    }

    Amount totalIn = 0;
    for (const auto& vin : tx["vin"].GetArray()) {
        TxInput in;
        in.txid = txid;
        in.height = result.height;

        if (vin.HasKey("coinbase")) {
            Height prev = std::max<Height>(result.height - 1, 0);
            in.coinbase = true;
            in.value = GetBlockSubsidy(prev);
            in.scriptHex = vin["coinbase"].GetString();
            in.prevTxid = in.scriptHex + "00000000";
            in.prevIndex = 0;
            in.prevHeight = result.height - 1;
            result.inputs.push_back(std::move(in));
            result.standardInputs.push_back(false);
            continue;
        }

        in.prevTxid = vin["txid"].GetString();
        in.prevIndex = static_cast<uint32_t>(vin["vout"].GetInt());

        rpc::JSONValue parentEntry = FetchRawTransaction(in.prevTxid, opts);
        in.prevHeight = parentEntry["height"].GetInt();
        if (in.prevHeight == 0) {
            result.unconfirmedInputs.push_back(in.prevTxid);
        }

        const rpc::JSONValue* parentVout = nullptr;
        for (const auto& candidate : parentEntry["tx"]["vout"].GetArray()) {
            if (candidate["n"].GetInt() == static_cast<int64_t>(in.prevIndex)) {
                parentVout = &candidate;
                break;
            }
        }
        if (!parentVout) {
            throw ProtocolError("output " + std::to_string(in.prevIndex) +
                                " missing from parent " + in.prevTxid);
        }

        TxOutput spent = ProcessVout(*parentVout, in.prevTxid, in.prevHeight);
        in.address = spent.address;
        in.value = spent.value;
        in.scriptHex = spent.scriptHex;
        in.index = spent.index;
        totalIn += in.value;

        bool standard = in.address.has_value();
        result.inputs.push_back(std::move(in));
        result.standardInputs.push_back(standard);
    }

    result.fee = totalIn == 0 ? 0 : totalIn - totalOut;
    return result;
}

TxHistory BitcoinCoreProvider::GetAddressHistory(const std::string& address,
                                                 const TxFetchOptions& opts) {
    rpc::JSONValue received = Call("listreceivedbyaddress", Params(0, false, true, address));
    TxHistory history;
    if (received.Size() == 0) {
        return history;
    }

    for (const auto& txid : received[0]["txids"].GetArray()) {
        history.push_back(GetTransaction(txid.GetString(), opts));
    }
    LOG_DEBUG(LogCategory::PROVIDER) << "History for " << address << ": "
                                     << history.size() << " transactions";
    return history;
}

AddressBalance BitcoinCoreProvider::GetBalance(const std::string& address) {
    AddressBalance balance;
    balance.confirmed = AmountFromValue(
        Call("getreceivedbyaddress", Params(address, 1)).GetDouble());
    Amount total = AmountFromValue(
        Call("getreceivedbyaddress", Params(address, 0)).GetDouble());
    balance.unconfirmed = total - balance.confirmed;
    return balance;
}

std::string BitcoinCoreProvider::BroadcastTransaction(const std::string& rawHex) {
    rpc::JSONValue result = Call("sendrawtransaction", Params(rawHex));
    if (!result.IsString()) {
        throw ProtocolError("unexpected sendrawtransaction result: " + result.ToJSON());
    }
    LOG_INFO(LogCategory::PROVIDER) << "Broadcast " << result.GetString();
    return result.GetString();
}

// ============================================================================
// Event Socket
// ============================================================================

std::string BitcoinCoreProvider::EventEndpoint() const {
    if (!config_.eventEndpoint.empty()) {
        return config_.eventEndpoint;
    }
    return "tcp://" + config_.host + ":" + std::to_string(config_.zmqPort);
}

void BitcoinCoreProvider::EnsureEventSocketLocked() {
    if (eventSocket_) {
        return;
    }
    if (!eventFactory_) {
        throw ConnectionError("no event transport configured");
    }

    std::unique_ptr<net::EventSocket> socket = eventFactory_();
    socket->Connect(EventEndpoint());

    eventStop_.store(false);
    eventThread_ = std::thread(&BitcoinCoreProvider::EventLoop, this, socket.get());
    eventSocket_ = std::move(socket);

    LOG_INFO(LogCategory::ZMQ) << "Event socket connected to " << EventEndpoint();
}

void BitcoinCoreProvider::MaybeReleaseEventSocketLocked() {
    if (blocksSubscribed_ || rawTxSubscribed_ || !eventSocket_) {
        return;
    }

    eventStop_.store(true);
    if (eventThread_.joinable()) {
        eventThread_.join();
    }
    eventSocket_->Close();
    eventSocket_.reset();

    LOG_INFO(LogCategory::ZMQ) << "Event socket released";
}

bool BitcoinCoreProvider::IsEventSocketOpen() const {
    std::lock_guard<std::mutex> lock(eventMutex_);
    return eventSocket_ != nullptr;
}

std::vector<std::string> BitcoinCoreProvider::WatchedAddresses() const {
    std::lock_guard<std::mutex> lock(eventMutex_);
    return watchList_;
}

void BitcoinCoreProvider::SubscribeToBlocks() {
    if (closed_.load()) {
        throw ConnectionError::Closed();
    }

    std::lock_guard<std::mutex> lock(eventMutex_);
    if (blocksSubscribed_) {
        return;
    }
    try {
        EnsureEventSocketLocked();
        eventSocket_->Subscribe(net::TOPIC_HASHBLOCK);
    } catch (const ConnectionError&) {
        MaybeReleaseEventSocketLocked();
        throw;
    }
    blocksSubscribed_ = true;
    LOG_DEBUG(LogCategory::ZMQ) << "Subscribed to " << net::TOPIC_HASHBLOCK;
}

void BitcoinCoreProvider::UnsubscribeFromBlocks() {
    std::lock_guard<std::mutex> lock(eventMutex_);
    if (!blocksSubscribed_) {
        return;
    }
    blocksSubscribed_ = false;
    if (rawTxSubscribed_ && eventSocket_) {
        eventSocket_->Unsubscribe(net::TOPIC_HASHBLOCK);
    }
    MaybeReleaseEventSocketLocked();
}

std::string BitcoinCoreProvider::SubscribeToAddress(const std::string& address) {
    if (closed_.load()) {
        throw ConnectionError::Closed();
    }

    std::lock_guard<std::mutex> lock(eventMutex_);
    if (std::find(watchList_.begin(), watchList_.end(), address) != watchList_.end()) {
        return address;
    }

    if (!rawTxSubscribed_) {
        try {
            EnsureEventSocketLocked();
            eventSocket_->Subscribe(net::TOPIC_RAWTX);
        } catch (const ConnectionError&) {
            MaybeReleaseEventSocketLocked();
            throw;
        }
        rawTxSubscribed_ = true;
        LOG_DEBUG(LogCategory::ZMQ) << "Subscribed to " << net::TOPIC_RAWTX;
    }

    watchList_.push_back(address);
    return address;
}

bool BitcoinCoreProvider::UnsubscribeFromAddress(const std::string& address) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    auto it = std::find(watchList_.begin(), watchList_.end(), address);
    if (it == watchList_.end()) {
        return false;
    }
    watchList_.erase(it);

    if (watchList_.empty() && rawTxSubscribed_) {
        rawTxSubscribed_ = false;
        if (blocksSubscribed_ && eventSocket_) {
            eventSocket_->Unsubscribe(net::TOPIC_RAWTX);
        }
        MaybeReleaseEventSocketLocked();
    }
    return true;
}

void BitcoinCoreProvider::EventLoop(net::EventSocket* socket) {
    LOG_DEBUG(LogCategory::ZMQ) << "Event loop started";

    while (!eventStop_.load()) {
        std::optional<net::EventMessage> message;
        try {
            message = socket->Receive(config_.eventPollInterval);
        } catch (const ConnectionError& e) {
            Advisory(std::string("event socket failed: ") + e.what());
            break;
        }
        if (!message || eventStop_.load()) {
            continue;
        }

        std::string payload = message->payloadHex;
        try {
            if (message->topic == net::TOPIC_HASHBLOCK) {
                pool_.ExecuteWithPriority(util::TaskPriority::High,
                    [this, payload]() { HandleBlockEvent(payload); });
            } else if (message->topic == net::TOPIC_RAWTX) {
                pool_.Execute([this, payload]() { HandleRawTxEvent(payload); });
            } else {
                LOG_DEBUG(LogCategory::ZMQ) << "Ignoring topic " << message->topic;
            }
        } catch (const std::runtime_error& e) {
            LOG_WARN(LogCategory::ZMQ) << "Dropped " << message->topic << " event: " << e.what();
        }
    }

    LOG_DEBUG(LogCategory::ZMQ) << "Event loop stopped";
}

void BitcoinCoreProvider::HandleBlockEvent(const std::string& hashHex) {
    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        if (!blocksSubscribed_) {
            return;
        }
    }

    try {
        BlockEvent event;
        event.hash = hashHex;
        event.raw = Call("getblock", Params(hashHex, 0)).GetString();
        rpc::JSONValue block = Call("getblock", Params(hashHex, 1));
        event.height = block["height"].GetInt();
        SetBlockHeight(event.height);

        LOG_INFO(LogCategory::PROVIDER) << "New block " << event.height << " " << hashHex;
        newBlocks_.Emit(event);
    } catch (const std::exception& e) {
        Advisory("block event " + hashHex + " failed: " + e.what());
    }
}

void BitcoinCoreProvider::HandleRawTxEvent(const std::string& txHex) {
    {
        std::lock_guard<std::mutex> lock(eventMutex_);
        if (!rawTxSubscribed_) {
            return;
        }
    }

    try {
        rpc::JSONValue decoded = Call("decoderawtransaction", Params(txHex));
        std::vector<std::string> watched = WatchedAddresses();

        std::string matched;
        for (const auto& vout : decoded["vout"].GetArray()) {
            auto addr = ScriptAddress(vout["scriptPubKey"]);
            if (addr && std::find(watched.begin(), watched.end(), *addr) != watched.end()) {
                matched = *addr;
                break;
            }
        }
        if (matched.empty()) {
            return;
        }

        LOG_DEBUG(LogCategory::PROVIDER) << "Transaction " << decoded["txid"].GetString()
                                         << " pays " << matched;
        newTransactions_.Emit(TransactionEvent{decoded, matched});
    } catch (const std::exception& e) {
        Advisory(std::string("transaction event failed: ") + e.what());
    }
}

// ============================================================================
// Configuration
// ============================================================================

BitcoinCoreProvider::Config ProviderConfigFromSettings(const util::ConfigManager& settings) {
    namespace keys = util::ConfigKeys;
    BitcoinCoreProvider::Config config;

    config.host = settings.GetString(keys::RPCCONNECT, config.host);
    config.port = static_cast<uint16_t>(
        settings.GetIntInRange(keys::RPCPORT, config.port, 1, 65535));
    config.user = settings.GetString(keys::RPCUSER, config.user);
    config.password = settings.GetString(keys::RPCPASSWORD, config.password);
    config.zmqPort = static_cast<uint16_t>(
        settings.GetIntInRange(keys::ZMQPORT, config.zmqPort, 1, 65535));

    config.maxReconnectAttempts = static_cast<int>(
        settings.GetIntInRange(keys::RECONNECTATTEMPTS, config.maxReconnectAttempts, 0, 1000000));
    config.reconnectInterval = util::Milliseconds(
        settings.GetIntInRange(keys::RECONNECTINTERVAL, config.reconnectInterval.count(),
                               0, 86400000));
    config.workerThreads = static_cast<size_t>(
        settings.GetIntInRange(keys::PROVIDERTHREADS,
                               static_cast<int64_t>(config.workerThreads), 1, 256));

    config.cache.expiry = util::Milliseconds(
        settings.GetIntInRange(keys::CACHETIMEOUT, config.cache.expiry.count(),
                               1, INT64_MAX / 2));
    config.cache.maxSize = static_cast<size_t>(
        settings.GetIntInRange(keys::MAXCACHESIZE,
                               static_cast<int64_t>(config.cache.maxSize), 1, INT64_MAX));
    config.cache.sweepInterval = util::Milliseconds(
        settings.GetIntInRange(keys::CACHESWEEPINTERVAL, config.cache.sweepInterval.count(),
                               0, INT64_MAX / 2));

    return config;
}

} // namespace provider
} // namespace chainsync
