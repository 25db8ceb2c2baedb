/*
 * facet_internal.h
 *
 *  Declarations shared by the facetCore sources. Not part of the public API.
 */

#ifndef FACET_INTERNAL_H
#define FACET_INTERNAL_H

#include "facetCore.h"
#include <string>

#define FACET_TYPE_DIAG_ENV "FACET_TYPE_DIAG"
#define FACET_OPERABLE_DIAG_ENV "FACET_OPERABLE_DIAG"

#define FACET_ABSENT_TYPE_NAME "absent"
#define FACET_ABSENT_TYPE_HASH 0UL

namespace facet
{
    //- Diagnostics
    bool diagnosticsRequested(const char* variable);
    bool operableDiagnostics();

    //- Type identity
    unsigned long generate_type_hash(const std::string& name, unsigned long serial);
}

#endif //FACET_INTERNAL_H
