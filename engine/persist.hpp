#pragma once
#include "log.hpp"
#include "pile.hpp"
#include <compost/timing.hpp>
#include <iosfwd>
#include <string>

namespace compost {

// Current save format. Version 1 predates the moisture/aeration/temperature
// records; such saves are loaded as an empty, reset pile.
inline constexpr int kSaveVersion = 2;

// clock is the caller's game clock at save time; written only if set.
bool writePile(std::ostream& out, const CompostPile& pile, Hours clock = kNever);
bool readPile(std::istream& in, CompostPile& pile, Hours* clock = nullptr,
              const StepOpts& opt = StepOpts{});

bool savePile(const CompostPile& pile, const std::string& path, Hours clock = kNever);
bool loadPile(CompostPile& pile, const std::string& path, Hours* clock = nullptr,
              const StepOpts& opt = StepOpts{});

} // namespace compost
