#ifndef VPERP_VPERP_HPP
#define VPERP_VPERP_HPP

// =============================================================================
// vperp - Perpetual futures on a virtual AMM
//
// Single include for embedding the venue.
// =============================================================================

#include "types.hpp"
#include "math.hpp"
#include "log.hpp"
#include "oracle.hpp"
#include "vamm.hpp"
#include "vault.hpp"
#include "market.hpp"
#include "access.hpp"
#include "insurance.hpp"
#include "fee_router.hpp"
#include "position.hpp"
#include "events.hpp"
#include "clearing_house.hpp"
#include "risk.hpp"
#include "config.hpp"
#include "venue.hpp"

#endif // VPERP_VPERP_HPP
