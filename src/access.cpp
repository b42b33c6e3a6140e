// =============================================================================
// access.cpp - Role Table
// =============================================================================

#include "lever/access.hpp"
#include "lever/log.hpp"

#include <mutex>

namespace lever {

AccessControl::AccessControl(const Address& owner) {
    roles_[static_cast<uint8_t>(Role::OWNER)].insert(owner);
}

bool AccessControl::has_role(Role role, const Address& account) const {
    std::shared_lock lock(mutex_);
    return has_role_locked(role, account);
}

std::vector<Address> AccessControl::members(Role role) const {
    std::shared_lock lock(mutex_);
    std::vector<Address> out;
    auto it = roles_.find(static_cast<uint8_t>(role));
    if (it == roles_.end()) return out;
    out.assign(it->second.begin(), it->second.end());
    return out;
}

int32_t AccessControl::grant(const Address& caller, Role role, const Address& account) {
    std::unique_lock lock(mutex_);
    if (!has_role_locked(Role::OWNER, caller)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(account)) {
        return errors::INVALID_AMOUNT;
    }

    roles_[static_cast<uint8_t>(role)].insert(account);
    log::logger()->info("role {} granted to {}", to_string(role), addresses::to_hex(account));
    return errors::OK;
}

int32_t AccessControl::revoke(const Address& caller, Role role, const Address& account) {
    std::unique_lock lock(mutex_);
    if (!has_role_locked(Role::OWNER, caller)) {
        return errors::UNAUTHORIZED;
    }

    auto it = roles_.find(static_cast<uint8_t>(role));
    if (it == roles_.end()) return errors::OK;

    // The table must always keep an owner
    if (role == Role::OWNER && it->second.size() == 1 && it->second.count(account) == 1) {
        return errors::INVALID_STATE;
    }

    it->second.erase(account);
    log::logger()->info("role {} revoked from {}", to_string(role), addresses::to_hex(account));
    return errors::OK;
}

bool AccessControl::has_role_locked(Role role, const Address& account) const {
    auto it = roles_.find(static_cast<uint8_t>(role));
    return it != roles_.end() && it->second.count(account) > 0;
}

} // namespace lever
