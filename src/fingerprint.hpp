#pragma once
#include "params.hpp"
#include <optional>
#include <string>

namespace culturerank {

enum class HashAlgorithm { Sha256, Fnv1a };

std::string hash_algorithm_name(HashAlgorithm algorithm);
std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name);

// Compact, sorted-key JSON of the effective parameters.
std::string canonical_params(const AlgorithmParams& params);

// Lowercase hex SHA-256 digest.
std::string sha256_hex(const std::string& data);

// 16-digit lowercase hex FNV-1a 64 digest. Needs no crypto library.
std::string fnv1a_hex(const std::string& data);

// "<algorithm>:<hex digest>" of canonical_params(params).
std::string param_set_id(const AlgorithmParams& params, HashAlgorithm algorithm);

} // namespace culturerank
