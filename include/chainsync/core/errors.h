// CHAINSYNC - Error Types
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Exception classes for the failure kinds surfaced by the provider and
// the sync engine. All derive from std::runtime_error.

#ifndef CHAINSYNC_CORE_ERRORS_H
#define CHAINSYNC_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace chainsync {

/// Transport-level failure: not connected, closed, or gave up reconnecting.
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {}
    
    static ConnectionError NotConnected() {
        return ConnectionError("client not connected");
    }
    
    static ConnectionError Closed() {
        return ConnectionError("client closed");
    }
    
    static ConnectionError GaveUp(const std::string& lastError) {
        return ConnectionError("gave up connecting to node: " + lastError);
    }
};

/// Malformed or unexpected data from the node.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Error object returned by the node for a specific call.
class RemoteError : public std::runtime_error {
public:
    RemoteError(const std::string& errorJson, const std::string& method)
        : std::runtime_error("RPC Error: " + errorJson + " - " + method)
        , errorJson_(errorJson)
        , method_(method) {}
    
    /// Raw error payload as received
    const std::string& GetErrorJson() const { return errorJson_; }
    
    /// Method that produced the error
    const std::string& GetMethod() const { return method_; }

private:
    std::string errorJson_;
    std::string method_;
};

/// Invalid argument or lookup (bad height, unknown address, bad unit).
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

/// A scan is already running or was halted mid-run.
class SyncBusyError : public std::runtime_error {
public:
    explicit SyncBusyError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Watching an address failed at the provider.
class SubscriptionError : public std::runtime_error {
public:
    explicit SubscriptionError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace chainsync

#endif // CHAINSYNC_CORE_ERRORS_H
