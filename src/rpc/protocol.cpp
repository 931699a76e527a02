// CHAINSYNC - Node RPC Framing Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/rpc/protocol.h>
#include <chainsync/util/time.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace chainsync {
namespace rpc {

// ============================================================================
// Outbound
// ============================================================================

std::string GenerateRequestId() {
    unsigned char bytes[4];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    std::ostringstream ss;
    ss << util::GetTimeMillis() << '-' << std::hex << std::setfill('0');
    for (unsigned char b : bytes) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

std::string BuildRequestPayload(const std::string& method,
                                const JSONValue& params,
                                const std::string& id) {
    JSONValue::Object obj;
    obj["jsonrpc"] = JSONValue(JSONRPC_VERSION);
    obj["id"] = JSONValue(id);
    obj["method"] = JSONValue(method);
    obj["params"] = params.IsArray() ? params : JSONValue(JSONValue::Array{});
    return JSONValue(std::move(obj)).ToJSON();
}

std::string Base64Encode(const std::string& input) {
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded;
    encoded.reserve(((input.size() + 2) / 3) * 4);

    int val = 0, valb = -6;
    for (unsigned char c : input) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        encoded.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    while (encoded.size() % 4) {
        encoded.push_back('=');
    }
    return encoded;
}

std::string BuildHttpRequest(const HttpCredentials& creds, const std::string& body) {
    std::ostringstream ss;

    ss << "POST / HTTP/1.1\r\n";
    ss << "Host: " << creds.host << ":" << creds.port << "\r\n";
    ss << "Content-Type: application/json\r\n";
    ss << "Authorization: Basic " << Base64Encode(creds.user + ":" + creds.password) << "\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: keep-alive\r\n";
    ss << "\r\n";
    ss << body;

    return ss.str();
}

bool IsSubscriptionMethod(const std::string& method) {
    const std::string suffix = SUBSCRIBE_SUFFIX;
    return method.size() >= suffix.size() &&
           method.compare(method.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ============================================================================
// ResponseStream
// ============================================================================

namespace {

bool StartsWithNoCase(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(str[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

void ResponseStream::Reset() {
    buffer_.clear();
    state_ = State::Idle;
    contentLength_.reset();
}

void ResponseStream::EmitBody(const std::string& body, std::vector<InboundLine>& out) {
    std::istringstream ss(body);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            out.push_back({false, 0, line});
        }
    }
}

std::vector<InboundLine> ResponseStream::Feed(const std::string& chunk) {
    std::vector<InboundLine> out;
    buffer_ += chunk;

    while (true) {
        if (state_ == State::Body) {
            size_t length = contentLength_.value_or(0);
            if (buffer_.size() < length) {
                break;
            }
            std::string body = buffer_.substr(0, length);
            buffer_.erase(0, length);
            EmitBody(body, out);
            state_ = State::Idle;
            contentLength_.reset();
            continue;
        }

        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos) {
            break;
        }

        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (state_ == State::Headers) {
            if (line.empty()) {
                state_ = (contentLength_ && *contentLength_ > 0) ? State::Body : State::Idle;
            } else if (StartsWithNoCase(line, "content-length:")) {
                try {
                    contentLength_ = static_cast<size_t>(std::stoul(line.substr(15)));
                } catch (const std::exception&) {
                    contentLength_.reset();
                }
            }
            continue;
        }

        if (line.empty()) {
            continue;
        }

        if (line.compare(0, 5, "HTTP/") == 0) {
            InboundLine status;
            status.isStatus = true;
            status.text = line;
            size_t sp = line.find(' ');
            if (sp != std::string::npos) {
                status.statusCode = std::atoi(line.c_str() + sp + 1);
            }
            out.push_back(std::move(status));
            state_ = State::Headers;
            contentLength_.reset();
            continue;
        }

        out.push_back({false, 0, line});
    }

    return out;
}

} // namespace rpc
} // namespace chainsync
