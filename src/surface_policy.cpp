#include "surface_policy.hpp"
#include <utility>

namespace culturerank {

bool SurfaceFilter::admits(const Candidate& candidate) const {
    if (require_moderated && !candidate.quality.moderated) return false;
    if (exclude_nsfw && candidate.quality.nsfw) return false;
    return true;
}

StaticSurfacePolicy::StaticSurfacePolicy(std::map<std::string, SurfaceFilter> table,
                                         SurfaceFilter fallback)
    : table_(std::move(table)), fallback_(fallback) {}

SurfaceFilter StaticSurfacePolicy::filter_for(const std::string& surface) const {
    auto it = table_.find(surface);
    if (it != table_.end()) return it->second;
    return fallback_;
}

} // namespace culturerank
