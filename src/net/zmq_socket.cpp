// CHAINSYNC - ZeroMQ Event Transport Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/net/zmq_socket.h>
#include <chainsync/core/errors.h>
#include <chainsync/util/logging.h>

#include <cerrno>
#include <vector>

#include <zmq.h>

namespace chainsync {
namespace net {

namespace {

std::string ZmqError(const std::string& what) {
    return what + ": " + zmq_strerror(zmq_errno());
}

} // namespace

ZmqEventSocket::ZmqEventSocket() {
    context_ = zmq_ctx_new();
    if (!context_) {
        throw ConnectionError(ZmqError("zmq_ctx_new failed"));
    }
}

ZmqEventSocket::~ZmqEventSocket() {
    Close();
    if (context_) {
        zmq_ctx_term(context_);
        context_ = nullptr;
    }
}

void ZmqEventSocket::Connect(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket_) {
        throw ConnectionError("event socket already connected");
    }

    socket_ = zmq_socket(context_, ZMQ_SUB);
    if (!socket_) {
        throw ConnectionError(ZmqError("zmq_socket failed"));
    }

    int linger = 0;
    zmq_setsockopt(socket_, ZMQ_LINGER, &linger, sizeof(linger));

    if (zmq_connect(socket_, endpoint.c_str()) != 0) {
        std::string error = ZmqError("zmq_connect to " + endpoint + " failed");
        zmq_close(socket_);
        socket_ = nullptr;
        throw ConnectionError(error);
    }

    LOG_INFO(util::LogCategory::ZMQ) << "Event socket connected to " << endpoint;
}

void ZmqEventSocket::SetOption(int option, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_) {
        throw ConnectionError::NotConnected();
    }
    if (zmq_setsockopt(socket_, option, value.data(), value.size()) != 0) {
        throw ConnectionError(ZmqError("zmq_setsockopt failed"));
    }
}

void ZmqEventSocket::Subscribe(const std::string& topic) {
    SetOption(ZMQ_SUBSCRIBE, topic);
    LOG_DEBUG(util::LogCategory::ZMQ) << "Subscribed to " << topic;
}

void ZmqEventSocket::Unsubscribe(const std::string& topic) {
    SetOption(ZMQ_UNSUBSCRIBE, topic);
    LOG_DEBUG(util::LogCategory::ZMQ) << "Unsubscribed from " << topic;
}

std::optional<EventMessage> ZmqEventSocket::Receive(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_) {
        return std::nullopt;
    }

    zmq_pollitem_t item;
    item.socket = socket_;
    item.fd = 0;
    item.events = ZMQ_POLLIN;
    item.revents = 0;

    int rc = zmq_poll(&item, 1, static_cast<long>(timeout.count()));
    if (rc < 0) {
        if (zmq_errno() == EINTR) {
            return std::nullopt;
        }
        throw ConnectionError(ZmqError("zmq_poll failed"));
    }
    if (rc == 0 || !(item.revents & ZMQ_POLLIN)) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    int more = 1;
    while (more) {
        zmq_msg_t msg;
        zmq_msg_init(&msg);
        if (zmq_msg_recv(&msg, socket_, 0) < 0) {
            std::string error = ZmqError("zmq_msg_recv failed");
            zmq_msg_close(&msg);
            throw ConnectionError(error);
        }
        parts.emplace_back(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
        more = zmq_msg_more(&msg);
        zmq_msg_close(&msg);
    }

    if (parts.size() < 2) {
        LOG_WARN(util::LogCategory::ZMQ) << "Dropping event with " << parts.size() << " frame(s)";
        return std::nullopt;
    }

    EventMessage message;
    message.topic = parts[0];
    message.payloadHex = HexStr(parts[1]);
    return message;
}

void ZmqEventSocket::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket_) {
        zmq_close(socket_);
        socket_ = nullptr;
        LOG_DEBUG(util::LogCategory::ZMQ) << "Event socket closed";
    }
}

EventSocketFactory MakeZmqEventSocketFactory() {
    return []() -> std::unique_ptr<EventSocket> {
        return std::make_unique<ZmqEventSocket>();
    };
}

} // namespace net
} // namespace chainsync
