#pragma once
#include "types.hpp"
#include <map>
#include <string>

namespace culturerank {

// Boolean admission filter for one surface.
struct SurfaceFilter {
    bool require_moderated = false;
    bool exclude_nsfw = false;

    bool admits(const Candidate& candidate) const;
};

// Surface name → filter. The policy table is owned outside the ranker;
// the ranker only applies the filter it is handed.
class SurfacePolicy {
public:
    virtual ~SurfacePolicy() = default;

    virtual SurfaceFilter filter_for(const std::string& surface) const = 0;
};

// Fixed table, typically read from configuration. Unknown surfaces get
// the fallback filter.
class StaticSurfacePolicy : public SurfacePolicy {
public:
    explicit StaticSurfacePolicy(std::map<std::string, SurfaceFilter> table,
                                 SurfaceFilter fallback = {});

    SurfaceFilter filter_for(const std::string& surface) const override;

private:
    std::map<std::string, SurfaceFilter> table_;
    SurfaceFilter fallback_;
};

} // namespace culturerank
