#pragma once

namespace compost {

// Game clock in (fractional) in-game hours. Monotonic, never negative.
using Hours = double;

// Sub-models integrate environmental effects at most once per elapsed hour.
inline constexpr Hours kHourGate = 1.0;

// Timestamp sentinel for "never happened" (inactive pile, unprimed model).
inline constexpr Hours kNever = -1.0;

inline constexpr bool isSet(Hours t) { return t >= 0.0; }

} // namespace compost
