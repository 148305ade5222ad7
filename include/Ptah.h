#ifndef PTAH_LIBRARY_H
#define PTAH_LIBRARY_H

#include "../src/initialization/initialization.hpp"
#include "../src/initialization/apply.hpp"
#include "../src/common/save_load.hpp"
#include "../src/utils/report.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Ptah::Initialization : descriptors, factories, presets, compute_fans,
//    generate() and apply().
//  - Ptah::Common::SaveLoad : name registry, get_config / serialize /
//    deserialize / get and JSON persistence.
//  - Ptah::Utils::Report : summary statistics of generated tensors.
// Every module is header-only under src/.

#endif // PTAH_LIBRARY_H
