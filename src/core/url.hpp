// File: src/core/url.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace modelstore {

/// Components of an identity URL
///
/// Accepted forms:
///   ixmp://PLATFORM/MODEL/SCENARIO[#VERSION]
///   MODEL/SCENARIO[#VERSION]
struct ParsedUrl {
    std::optional<std::string> platform;
    std::string model;
    std::string scenario;
    Version version;
};

/// Parse an identity URL
///
/// MODEL contains no "/", SCENARIO may. VERSION is an unsigned integer or
/// "new"; without a fragment the version is unset (default version).
/// @throws ValidationError for other schemes, query strings, missing
///         components or a malformed version
ParsedUrl ParseUrl(const std::string& url);

/// Format "MODEL/SCENARIO#VERSION", omitting the fragment for an unset version
std::string FormatUrl(const std::string& model,
                      const std::string& scenario,
                      const Version& version);

} // namespace modelstore
