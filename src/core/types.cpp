#include "core/types.hpp"

#include <type_traits>

// Implementation is entirely in the header for this simple types module.
// This file exists for build system compatibility.

namespace uuidstamp {

static_assert(std::is_trivially_copyable_v<GregorianTimestamp>,
              "GregorianTimestamp should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Instant>, "Instant should be trivially copyable");

// Largest 60-bit tick count must stay inside int64_t after the epoch shift.
static_assert(GregorianTimestamp((uint64_t{1} << 60) - 1).since_unix_epoch().count() > 0,
              "60-bit UUID timestamps must fit in int64_t");
static_assert(GregorianTimestamp(0).since_unix_epoch().count() == -kGregorianToUnixTicks);

} // namespace uuidstamp
