// File: src/core/url.cpp
#include "core/url.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace modelstore {

namespace {

constexpr const char* kScheme = "ixmp";

Version ParseVersion(const std::string& fragment, const std::string& url) {
    if (fragment == "new") {
        return Version::New();
    }
    if (fragment.empty() ||
        !std::all_of(fragment.begin(), fragment.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ValidationError("URL '" + url + "' has invalid version '" + fragment +
                              "'; expected an integer or 'new'");
    }
    try {
        return Version(std::stoi(fragment));
    } catch (const std::out_of_range&) {
        throw ValidationError("URL '" + url + "' has out-of-range version " + fragment);
    }
}

} // namespace

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl result;
    std::string rest = url;

    // Fragment
    size_t hash_pos = rest.find('#');
    std::optional<std::string> fragment;
    if (hash_pos != std::string::npos) {
        fragment = rest.substr(hash_pos + 1);
        rest = rest.substr(0, hash_pos);
    }

    if (rest.find('?') != std::string::npos) {
        throw ValidationError("URL '" + url + "' may not contain a query string");
    }

    // Scheme and platform name
    size_t scheme_pos = rest.find("://");
    if (scheme_pos != std::string::npos) {
        std::string scheme = rest.substr(0, scheme_pos);
        if (scheme != kScheme) {
            throw ValidationError("URL '" + url + "' has scheme '" + scheme +
                                  "'; expected '" + kScheme + "'");
        }
        rest = rest.substr(scheme_pos + 3);

        size_t slash = rest.find('/');
        std::string platform = rest.substr(0, slash);
        if (platform.empty()) {
            throw ValidationError("URL '" + url + "' does not name a platform");
        }
        result.platform = platform;
        rest = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
    }

    // MODEL/SCENARIO; the scenario may itself contain "/"
    size_t slash = rest.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size()) {
        throw ValidationError("URL '" + url + "' must include MODEL/SCENARIO");
    }
    result.model = rest.substr(0, slash);
    result.scenario = rest.substr(slash + 1);

    if (fragment) {
        result.version = ParseVersion(*fragment, url);
    }

    return result;
}

std::string FormatUrl(const std::string& model,
                      const std::string& scenario,
                      const Version& version) {
    std::string url = model + "/" + scenario;
    if (!version.IsDefault()) {
        url += "#" + version.ToString();
    }
    return url;
}

} // namespace modelstore
