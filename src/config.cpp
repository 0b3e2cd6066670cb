#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace culturerank {

nlohmann::json Config::defaults_json() {
    nlohmann::json surfaces = nlohmann::json::object();
    for (const char* name : {"home_mix", "home_diverse", "following", "scenes", "search", "work_page"}) {
        surfaces[name] = {{"require_moderated", false}, {"exclude_nsfw", false}};
    }
    return {
        {"params", params_to_json(AlgorithmParams{})},
        {"surfaces", surfaces},
        {"fingerprint", "sha256"}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string config_path() {
    if (const char* v = std::getenv("CULTURERANK_CONFIG")) {
        if (*v) return expand_home(v);
    }
    return expand_home("~/.culturerank/config.json");
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("params") && j["params"].is_object())
        cfg.params = resolve_params(cfg.params, j["params"]);

    if (j.contains("surfaces") && j["surfaces"].is_object()) {
        for (auto& [name, obj] : j["surfaces"].items()) {
            if (!obj.is_object()) continue;
            SurfaceFilter filter;
            if (obj.contains("require_moderated") && obj["require_moderated"].is_boolean())
                filter.require_moderated = obj["require_moderated"].get<bool>();
            if (obj.contains("exclude_nsfw") && obj["exclude_nsfw"].is_boolean())
                filter.exclude_nsfw = obj["exclude_nsfw"].get<bool>();
            cfg.surfaces[name] = filter;
        }
    }

    if (j.contains("fingerprint") && j["fingerprint"].is_string()) {
        auto name = j["fingerprint"].get<std::string>();
        if (auto algo = parse_hash_algorithm(name)) {
            cfg.fingerprint = *algo;
        } else {
            std::cerr << "[config] Unknown fingerprint algorithm '" << name
                      << "', using sha256\n";
        }
    }
    return cfg;
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << path << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("CULTURERANK_STRATEGY")) {
        cfg.params = resolve_params(cfg.params, nlohmann::json::object({{"strategy", v}}));
    }
    if (const char* v = std::getenv("CULTURERANK_DIVERSITY_CAP_N")) {
        char* end = nullptr;
        long long n = std::strtoll(v, &end, 10);
        if (end != v && *end == '\0') {
            cfg.params = resolve_params(cfg.params, nlohmann::json::object({{"diversityCapN", n}}));
        } else {
            std::cerr << "[config] Ignoring CULTURERANK_DIVERSITY_CAP_N=" << v << "\n";
        }
    }
    if (const char* v = std::getenv("CULTURERANK_FINGERPRINT")) {
        if (auto algo = parse_hash_algorithm(v)) {
            cfg.fingerprint = *algo;
        } else {
            std::cerr << "[config] Ignoring CULTURERANK_FINGERPRINT=" << v << "\n";
        }
    }

    return cfg;
}

StaticSurfacePolicy Config::surface_policy() const {
    return StaticSurfacePolicy(surfaces);
}

} // namespace culturerank
