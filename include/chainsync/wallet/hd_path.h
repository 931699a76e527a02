// CHAINSYNC - HD Derivation Paths
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// BIP32 path parsing and the BIP44/49/84/86 conventions the sync engine
// relies on: m/purpose'/coin'/account'/change/index

#ifndef CHAINSYNC_WALLET_HD_PATH_H
#define CHAINSYNC_WALLET_HD_PATH_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chainsync {
namespace wallet {

/// Hardened key derivation threshold
constexpr uint32_t HARDENED_FLAG = 0x80000000;

// ============================================================================
// Account Role and Address Type
// ============================================================================

/// HD chain of an account: receiving (external) or change (internal)
enum class Role {
    External,
    Internal
};

const char* RoleToString(Role role);

/// Script type implied by the path's purpose
enum class AddressType {
    P2PKH,        // 44'
    P2SH_P2WPKH,  // 49'
    P2WPKH,       // 84'
    P2TR          // 86'
};

const char* AddressTypeToString(AddressType type);

// ============================================================================
// Derivation Path
// ============================================================================

struct PathComponent {
    uint32_t index;
    bool hardened;

    PathComponent(uint32_t idx = 0, bool hard = false)
        : index(idx), hardened(hard) {}

    /// Parse from string (e.g., "44'" or "0")
    static std::optional<PathComponent> FromString(const std::string& str);

    std::string ToString() const;

    bool operator==(const PathComponent& other) const {
        return index == other.index && hardened == other.hardened;
    }
};

/**
 * A BIP32 derivation path.
 *
 * Example paths:
 * - m/84'/0'/0'/0/0  (first receiving address)
 * - m/84'/0'/0'/1/0  (first change address)
 */
class DerivationPath {
public:
    DerivationPath() = default;

    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}

    /// Parse from string (e.g., "m/84'/0'/0'/0/0")
    static std::optional<DerivationPath> FromString(const std::string& path);

    const std::vector<PathComponent>& GetComponents() const { return components_; }
    size_t Depth() const { return components_.size(); }
    bool IsEmpty() const { return components_.empty(); }

    /// Same path with the last component incremented
    DerivationPath Next() const;

    std::string ToString() const;

    bool operator==(const DerivationPath& other) const { return components_ == other.components_; }
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<PathComponent> components_;
};

// ============================================================================
// String Helpers
// ============================================================================

namespace hdpath {

/// Number of components in a full account path
constexpr size_t ACCOUNT_PATH_DEPTH = 5;

/// Parse a full m/purpose'/coin'/account'/change/index path.
/// Throws ValidationError on malformed input.
DerivationPath Parse(const std::string& path);

/// Throws ValidationError for an unknown purpose
AddressType GetAddressType(const std::string& path);

/// "m/84'/0'/0'/0/4" -> "m/84'/0'/0'/0/5"
std::string BumpIndex(const std::string& path);

/// change 0 -> External, 1 -> Internal
Role GetRole(const std::string& path);

/// Path of the given index on a role's chain
std::string MakePath(uint32_t purpose, uint32_t coinType, uint32_t account,
                     Role role, uint32_t index);

} // namespace hdpath

} // namespace wallet
} // namespace chainsync

#endif // CHAINSYNC_WALLET_HD_PATH_H
