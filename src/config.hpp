#pragma once
#include "fingerprint.hpp"
#include "params.hpp"
#include "surface_policy.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace culturerank {

struct Config {
    AlgorithmParams params;                       // defaults before request overrides
    std::map<std::string, SurfaceFilter> surfaces;
    HashAlgorithm fingerprint = HashAlgorithm::Sha256;

    // Load from ~/.culturerank/config.json (or $CULTURERANK_CONFIG) + env vars
    static Config load();

    // Build from an already-parsed document; missing keys keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Surface policy backed by the `surfaces` table
    StaticSurfacePolicy surface_policy() const;
};

// Path load() reads: $CULTURERANK_CONFIG or ~/.culturerank/config.json
std::string config_path();

} // namespace culturerank
