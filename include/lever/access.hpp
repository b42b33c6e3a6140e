#ifndef LEVER_ACCESS_HPP
#define LEVER_ACCESS_HPP

#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace lever {

// =============================================================================
// AccessControl - Role Table Checked at Every Privileged Entry Point
// =============================================================================
//
// Each role is assigned independently. OWNER administers the table; the
// deployment owner passed to the constructor holds OWNER from the start.

class AccessControl {
public:
    explicit AccessControl(const Address& owner);
    ~AccessControl() = default;

    // Non-copyable
    AccessControl(const AccessControl&) = delete;
    AccessControl& operator=(const AccessControl&) = delete;

    bool has_role(Role role, const Address& account) const;
    std::vector<Address> members(Role role) const;

    // OWNER only
    int32_t grant(const Address& caller, Role role, const Address& account);
    int32_t revoke(const Address& caller, Role role, const Address& account);

private:
    std::unordered_map<uint8_t, std::unordered_set<Address, AddressHash>> roles_;
    mutable std::shared_mutex mutex_;

    bool has_role_locked(Role role, const Address& account) const;
};

} // namespace lever

#endif // LEVER_ACCESS_HPP
