#pragma once

#include "IGraphStore.hpp"
#include "../api/Config.hpp"

#include <functional>
#include <memory>

namespace surveyor {

using GraphStoreFactory = std::function<std::unique_ptr<IGraphStore>(const DatabaseSelection&, ErrorInfo*)>;

// Factory function to create graph stores based on the selected database system
std::unique_ptr<IGraphStore> createGraphStore(const DatabaseSelection& selection, ErrorInfo* err = nullptr);

} // namespace surveyor
