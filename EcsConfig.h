#pragma once

#include "ComponentFactory.h"
#include "DiagConfig.h"

#include <cstddef>

struct EcsConfig {
    // Per-kind free-list capacity of the World's ComponentFactory.
    std::size_t maxPoolSize = ComponentFactory::MAX_POOL_SIZE;

    // Hand components detached by RemoveComponent/RemoveEntity back to the
    // factory pool. Off by default: removed components are simply dropped.
    bool recycleOnRemove = false;

    // Informational lifecycle lines on stdout. Warnings always print.
    bool verbose = false;

    diag::DiagnosticsConfig diagnostics{};
};
