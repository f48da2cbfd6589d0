#ifndef VPERP_ACCESS_HPP
#define VPERP_ACCESS_HPP

#include <shared_mutex>
#include <unordered_set>

#include "types.hpp"

namespace vperp {

// =============================================================================
// AccessControl - Admin set checked before privileged mutations
// =============================================================================

class AccessControl {
public:
    AccessControl() = default;
    explicit AccessControl(const Address& admin);

    bool is_admin(const Address& who) const;

    // Only an existing admin may grant or revoke
    int32_t grant_admin(const Address& caller, const Address& who);
    int32_t revoke_admin(const Address& caller, const Address& who);

    // OK or UNAUTHORIZED
    int32_t require_admin(const Address& who) const;

    size_t admin_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_set<Address, AddressHash> admins_;
};

} // namespace vperp

#endif // VPERP_ACCESS_HPP
