#pragma once
#include <cstdint>

namespace pmarket { namespace chain { namespace config {

static constexpr uint64_t _KB = 1024;
static constexpr uint64_t _MB = _KB * 1024;

/** Market fees are fixed point with a denominator of 1,000,000 */
const static uint32_t fee_range = 1000000;

const static auto default_state_size = 64*_MB;

} } } // namespace pmarket::chain::config
