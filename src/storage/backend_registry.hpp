// File: src/storage/backend_registry.hpp
#pragma once

#include "storage/backend.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace modelstore {

/// Creates an engine from its string options
using BackendFactory = std::function<std::unique_ptr<Backend>(const BackendOptions&)>;

/// Register an engine class under a name, replacing any previous factory
/// "memory" and "sqlite" are registered from the start.
void RegisterBackend(const std::string& name, BackendFactory factory);

/// Names of all registered engine classes, sorted
std::vector<std::string> RegisteredBackends();

/// Create an engine of a registered class
/// @throws ValidationError for an unknown class name or options the engine rejects
std::unique_ptr<Backend> CreateBackend(const std::string& name, const BackendOptions& options);

} // namespace modelstore
