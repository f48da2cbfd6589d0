// =============================================================================
// access.cpp - Admin permission checks
// =============================================================================

#include "vperp/access.hpp"

#include <mutex>

namespace vperp {

AccessControl::AccessControl(const Address& admin) {
    admins_.insert(admin);
}

bool AccessControl::is_admin(const Address& who) const {
    std::shared_lock lock(mutex_);
    return admins_.count(who) > 0;
}

int32_t AccessControl::require_admin(const Address& who) const {
    return is_admin(who) ? errors::OK : errors::UNAUTHORIZED;
}

int32_t AccessControl::grant_admin(const Address& caller, const Address& who) {
    std::unique_lock lock(mutex_);
    if (admins_.count(caller) == 0) {
        return errors::UNAUTHORIZED;
    }
    if (!admins_.insert(who).second) {
        return errors::ALREADY_EXISTS;
    }
    return errors::OK;
}

int32_t AccessControl::revoke_admin(const Address& caller, const Address& who) {
    std::unique_lock lock(mutex_);
    if (admins_.count(caller) == 0) {
        return errors::UNAUTHORIZED;
    }
    // The last admin cannot be removed
    if (admins_.size() == 1 && admins_.count(who) > 0) {
        return errors::INVALID_CONFIG;
    }
    admins_.erase(who);
    return errors::OK;
}

size_t AccessControl::admin_count() const {
    std::shared_lock lock(mutex_);
    return admins_.size();
}

} // namespace vperp
