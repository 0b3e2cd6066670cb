#include "fingerprint.hpp"
#include "rng.hpp"
#include "util.hpp"

#ifdef CULTURERANK_USE_COMMONCRYPTO
#include <CommonCrypto/CommonDigest.h>
#else
#include <openssl/sha.h>
#endif
#include <cstdio>

namespace culturerank {

std::string hash_algorithm_name(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Fnv1a ? "fnv1a" : "sha256";
}

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "sha256" || n == "sha-256") return HashAlgorithm::Sha256;
    if (n == "fnv1a" || n == "fnv-1a") return HashAlgorithm::Fnv1a;
    return std::nullopt;
}

std::string canonical_params(const AlgorithmParams& params) {
    return params_to_json(params).dump();
}

std::string sha256_hex(const std::string& data) {
#ifdef CULTURERANK_USE_COMMONCRYPTO
    unsigned char hash[CC_SHA256_DIGEST_LENGTH];
    CC_SHA256(data.data(), static_cast<CC_LONG>(data.size()), hash);
    return hex_encode(hash, CC_SHA256_DIGEST_LENGTH);
#else
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return hex_encode(hash, SHA256_DIGEST_LENGTH);
#endif
}

std::string fnv1a_hex(const std::string& data) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(fnv1a64(data)));
    return buf;
}

std::string param_set_id(const AlgorithmParams& params, HashAlgorithm algorithm) {
    std::string canonical = canonical_params(params);
    std::string digest = algorithm == HashAlgorithm::Fnv1a ? fnv1a_hex(canonical)
                                                           : sha256_hex(canonical);
    return hash_algorithm_name(algorithm) + ":" + digest;
}

} // namespace culturerank
