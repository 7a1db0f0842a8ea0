#pragma once
#include "pile.hpp"
#include <string>

namespace compost {

// Sanity checks over a pile's observable state: finite values, levels in
// [0,1], progress consistent with the finished flag, timestamps ordered.
// On failure returns false and, if `why` is given, names the first broken rule.
bool checkInvariants(const CompostPile& pile, std::string* why = nullptr);

} // namespace compost
