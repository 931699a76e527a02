// CHAINSYNC - HD Derivation Paths Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/wallet/hd_path.h>
#include <chainsync/core/errors.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace chainsync {
namespace wallet {

const char* RoleToString(Role role) {
    switch (role) {
        case Role::External: return "external";
        case Role::Internal: return "internal";
    }
    return "unknown";
}

const char* AddressTypeToString(AddressType type) {
    switch (type) {
        case AddressType::P2PKH:       return "p2pkh";
        case AddressType::P2SH_P2WPKH: return "p2sh-p2wpkh";
        case AddressType::P2WPKH:      return "p2wpkh";
        case AddressType::P2TR:        return "p2tr";
    }
    return "unknown";
}

// ============================================================================
// PathComponent Implementation
// ============================================================================

std::optional<PathComponent> PathComponent::FromString(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    bool hardened = false;
    std::string numStr = str;

    if (str.back() == '\'' || str.back() == 'h' || str.back() == 'H') {
        hardened = true;
        numStr = str.substr(0, str.size() - 1);
    }

    if (numStr.empty() || numStr.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    errno = 0;
    unsigned long long value = std::strtoull(numStr.c_str(), nullptr, 10);
    if (errno == ERANGE || value >= HARDENED_FLAG) {
        return std::nullopt;
    }
    return PathComponent(static_cast<uint32_t>(value), hardened);
}

std::string PathComponent::ToString() const {
    return std::to_string(index) + (hardened ? "'" : "");
}

// ============================================================================
// DerivationPath Implementation
// ============================================================================

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path) {
    if (path.empty()) {
        return DerivationPath();
    }

    std::string p = path;

    // Remove leading "m/" or "M/"
    if (p.size() >= 2 && (p[0] == 'm' || p[0] == 'M') && p[1] == '/') {
        p = p.substr(2);
    } else if (p.size() == 1 && (p[0] == 'm' || p[0] == 'M')) {
        p.clear();
    }

    if (p.empty()) {
        return DerivationPath();
    }

    std::vector<PathComponent> components;
    std::istringstream stream(p);
    std::string token;

    while (std::getline(stream, token, '/')) {
        auto comp = PathComponent::FromString(token);
        if (!comp) {
            return std::nullopt;
        }
        components.push_back(*comp);
    }

    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::Next() const {
    if (components_.empty()) {
        throw ValidationError("cannot bump an empty path");
    }
    std::vector<PathComponent> next = components_;
    if (next.back().index + 1 >= HARDENED_FLAG) {
        throw ValidationError("path index overflow: " + ToString());
    }
    ++next.back().index;
    return DerivationPath(std::move(next));
}

std::string DerivationPath::ToString() const {
    std::string result = "m";
    for (const auto& comp : components_) {
        result += "/" + comp.ToString();
    }
    return result;
}

// ============================================================================
// String Helpers
// ============================================================================

namespace hdpath {

DerivationPath Parse(const std::string& path) {
    auto parsed = DerivationPath::FromString(path);
    if (!parsed || parsed->Depth() != ACCOUNT_PATH_DEPTH) {
        throw ValidationError("invalid derivation path: " + path);
    }
    const auto& comps = parsed->GetComponents();
    if (!comps[0].hardened || !comps[1].hardened || !comps[2].hardened ||
        comps[3].hardened || comps[4].hardened) {
        throw ValidationError("invalid derivation path: " + path);
    }
    return *parsed;
}

AddressType GetAddressType(const std::string& path) {
    uint32_t purpose = Parse(path).GetComponents()[0].index;
    switch (purpose) {
        case 44: return AddressType::P2PKH;
        case 49: return AddressType::P2SH_P2WPKH;
        case 84: return AddressType::P2WPKH;
        case 86: return AddressType::P2TR;
        default:
            throw ValidationError("unsupported path purpose " + std::to_string(purpose));
    }
}

std::string BumpIndex(const std::string& path) {
    return Parse(path).Next().ToString();
}

Role GetRole(const std::string& path) {
    uint32_t change = Parse(path).GetComponents()[3].index;
    if (change == 0) {
        return Role::External;
    }
    if (change == 1) {
        return Role::Internal;
    }
    throw ValidationError("invalid change component in " + path);
}

std::string MakePath(uint32_t purpose, uint32_t coinType, uint32_t account,
                     Role role, uint32_t index) {
    DerivationPath path({
        PathComponent(purpose, true),
        PathComponent(coinType, true),
        PathComponent(account, true),
        PathComponent(role == Role::External ? 0 : 1, false),
        PathComponent(index, false)
    });
    return path.ToString();
}

} // namespace hdpath

} // namespace wallet
} // namespace chainsync
