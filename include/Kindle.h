#ifndef KINDLE_LIBRARY_H
#define KINDLE_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/save_load.hpp"
#include "../src/remap/materialize.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the warm-start entry point, settings, vocabulary remapping and
//    checkpoint helpers.
//  - Header-only; implementation lives in the modules under src/.

#endif // KINDLE_LIBRARY_H
