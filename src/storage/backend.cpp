// File: src/storage/backend.cpp
#include "storage/backend.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>

namespace modelstore {

const char* ToString(IndexField field) {
    switch (field) {
        case IndexField::SETS: return "sets";
        case IndexField::NAMES: return "names";
    }
    return "unknown";
}

IndexField ParseIndexField(const std::string& str) {
    if (str == "sets") return IndexField::SETS;
    if (str == "names") return IndexField::NAMES;
    throw ValidationError("Unknown item index field: " + str + " (expected 'sets' or 'names')");
}

// ============================================================================
// Default implementations
// ============================================================================

int Backend::Clone(const Session& session, Backend& dest, const CloneRequest& request) {
    if (CloneFormat() != dest.CloneFormat()) {
        throw UnsupportedError("Cannot clone from backend '" + Name() + "' (format " +
                               CloneFormat() + ") to backend '" + dest.Name() +
                               "' (format " + dest.CloneFormat() + ")");
    }

    ScenarioSnapshot snapshot = ExportSnapshot(session);
    ApplyCloneFilter(snapshot, request.keep_solution, request.first_model_year);

    logger_.Debug("Clone " + session.model + "/" + session.scenario + " -> " +
                  request.model + "/" + request.scenario);

    int version = dest.ImportSnapshot(request.model, request.scenario, request.annotation,
                                      snapshot);

    // Annotations of the source version follow it to the new version
    if (session.version && *session.version > 0) {
        MetaMap meta = GetMeta(session.model, session.scenario, session.version, true);
        if (!meta.empty()) {
            dest.SetMeta(meta, request.model, request.scenario, version);
        }
    }
    return version;
}

std::map<std::string, bool> Backend::GetAuth(const std::string& user,
                                             const std::vector<std::string>& models,
                                             const std::string& access) {
    (void)user;
    (void)access;
    std::map<std::string, bool> result;
    for (const auto& model : models) {
        result[model] = true;
    }
    return result;
}

// ============================================================================
// Option helpers
// ============================================================================

void RejectUnknownOptions(const BackendOptions& options,
                          const std::vector<std::string>& accepted,
                          const std::string& engine) {
    for (const auto& [key, value] : options) {
        if (std::find(accepted.begin(), accepted.end(), key) == accepted.end()) {
            std::string names;
            for (const auto& name : accepted) {
                names += names.empty() ? name : ", " + name;
            }
            throw ValidationError("Backend '" + engine + "' does not accept option '" + key +
                                  "' (accepted: " + names + ")");
        }
    }
}

bool ParseBoolOption(const std::string& key, const std::string& value) {
    if (value == "true" || value == "True" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "False" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    throw ValidationError("Option '" + key + "' expects a boolean, got '" + value + "'");
}

size_t ParseSizeOption(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos == value.size() && parsed >= 0) {
            return static_cast<size_t>(parsed);
        }
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw ValidationError("Option '" + key + "' expects a non-negative integer, got '" +
                          value + "'");
}

std::string CurrentTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

std::string DefaultUser() {
    const char* user = std::getenv("USER");
    return user != nullptr && user[0] != '\0' ? user : "unknown";
}

} // namespace modelstore
