#pragma once

#include "../../src/localization.hpp"

#include <cstdlib>

// Loads the English catalog regardless of the caller's locale, so tests can
// compare against message text.
inline void init_test_localization() {
    setenv("LANG", "C", 1);
    init_localization();
}
