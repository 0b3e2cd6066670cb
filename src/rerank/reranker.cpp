#include "reranker.hpp"
#include "dpp.hpp"
#include "mmr.hpp"

namespace culturerank {

std::unique_ptr<Reranker> create_reranker(Strategy strategy) {
    if (strategy == Strategy::Dpp) {
        return std::make_unique<DppReranker>();
    }
    return std::make_unique<MmrReranker>();
}

} // namespace culturerank
