#ifndef BGJOBS_SHARED_STATE_HPP
#define BGJOBS_SHARED_STATE_HPP

// =============================================================================
// bgjobs Shared State
// =============================================================================
//
// The blocking primitives underneath job groups. Both are built on
// sync_primitive_base (one lock + one condition variable, lock type chosen
// by policy).
//
// Primitives:
// - slot_semaphore: fixed-capacity counting semaphore with an idle wait
// - bg_result: write-once value or failure with blocking, repeatable reads
//
// =============================================================================

// Foundation headers
#include "shared_state/concepts.hpp"
#include "shared_state/policies.hpp"
#include "shared_state/crtp_base.hpp"

// Primitive headers
#include "shared_state/semaphore.hpp"
#include "shared_state/bg_result.hpp"

#endif // BGJOBS_SHARED_STATE_HPP
