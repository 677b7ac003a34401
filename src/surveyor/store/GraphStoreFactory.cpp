#include "GraphStoreFactory.hpp"
#include "MemoryGraphStore.hpp"

#include <plog/Log.h>

namespace surveyor {

std::unique_ptr<IGraphStore> createGraphStore(const DatabaseSelection& selection, ErrorInfo* err)
{
    if (selection.system.empty() || selection.system == "memory")
        return std::make_unique<MemoryGraphStore>();

    // Relational backends are provided by embedders through a custom factory
    PLOG_ERROR << "Graph store engine '" << selection.system << "' is not available in this build";
    Fail(err, ErrorKind::Configuration, "failed to initialize database store",
         "engine '" + selection.system + "' is not available in this build");
    return nullptr;
}

} // namespace surveyor
