#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace culturerank {

// Structurally malformed request: a broken upstream contract, not a
// recoverable ranking condition.
class RequestError : public std::runtime_error {
public:
    explicit RequestError(const std::string& what) : std::runtime_error(what) {}
};

// Decode a request. Both historical candidate shapes are accepted:
// quality flags at candidate level or under features, CVS components as
// `like` or `likeSignal` (etc.), support density directly or under
// `publicMetricsHint`/`publicMetrics`, views as `qualifiedUniqueViews` or
// `uniqueViews`. Throws RequestError on missing or wrongly typed fields.
RankRequest request_from_json(const nlohmann::json& j);

Candidate candidate_from_json(const nlohmann::json& j);

nlohmann::json breakdown_to_json(const ScoreBreakdown& breakdown);
nlohmann::json report_to_json(const ConstraintsReport& report);
nlohmann::json response_to_json(const RankResponse& response);

} // namespace culturerank
