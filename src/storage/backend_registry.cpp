// File: src/storage/backend_registry.cpp
#include "storage/backend_registry.hpp"
#include "core/errors.hpp"
#include "storage/memory_backend.hpp"
#include "storage/sqlite_backend.hpp"
#include <map>
#include <mutex>

namespace modelstore {

namespace {

struct Registry {
    std::mutex mutex;
    std::map<std::string, BackendFactory> factories;

    Registry() {
        factories["memory"] = [](const BackendOptions& options) -> std::unique_ptr<Backend> {
            return std::make_unique<MemoryBackend>(MemoryBackend::ConfigFromOptions(options));
        };
        factories["sqlite"] = [](const BackendOptions& options) -> std::unique_ptr<Backend> {
            return std::make_unique<SqliteBackend>(SqliteBackend::ConfigFromOptions(options));
        };
    }
};

Registry& GetRegistry() {
    static Registry registry;
    return registry;
}

} // namespace

void RegisterBackend(const std::string& name, BackendFactory factory) {
    if (name.empty()) {
        throw ValidationError("Backend class name must not be empty");
    }
    Registry& registry = GetRegistry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.factories[name] = std::move(factory);
}

std::vector<std::string> RegisteredBackends() {
    Registry& registry = GetRegistry();
    std::lock_guard<std::mutex> lock(registry.mutex);

    std::vector<std::string> names;
    for (const auto& [name, factory] : registry.factories) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<Backend> CreateBackend(const std::string& name, const BackendOptions& options) {
    BackendFactory factory;
    {
        Registry& registry = GetRegistry();
        std::lock_guard<std::mutex> lock(registry.mutex);

        auto it = registry.factories.find(name);
        if (it == registry.factories.end()) {
            std::string names;
            for (const auto& [registered, unused] : registry.factories) {
                names += names.empty() ? registered : ", " + registered;
            }
            throw ValidationError("Unknown backend class '" + name + "' (registered: " +
                                  names + ")");
        }
        factory = it->second;
    }
    return factory(options);
}

} // namespace modelstore
