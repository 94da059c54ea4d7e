#pragma once

#include "irmcp/capability/capability_registry.h"
#include "irmcp/corpus/text_corpus.h"

namespace irmcp::app {

// build_capability_registry constructs the fixed set of tools and resources served by
// the process. Called once at startup; the result lives until exit.
//
// Tools (in order):     documentation, method_lookup, changelog, example
// Resources (in order): api_reference, configuration
[[nodiscard]] capability::CapabilityRegistry build_capability_registry(
    const corpus::CorpusPaths& paths);

}  // namespace irmcp::app
