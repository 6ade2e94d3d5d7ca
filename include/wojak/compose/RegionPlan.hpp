#pragma once

#include "wojak/compose/GeometricAligner.hpp"
#include "wojak/face/FaceTypes.hpp"
#include "wojak/templates/TemplateTypes.hpp"
#include <map>
#include <string>
#include <variant>

namespace wojak {
namespace compose {

/// Region will be warped and composited with this transform
struct Eligible {
    SimilarityTransform transform;
};

/// Region keeps the template pixels
struct Excluded {
    std::string reason;
};

using RegionOutcome = std::variant<Eligible, Excluded>;

/// Outcome per region, iterated in blend order
using RegionPlan = std::map<face::RegionName, RegionOutcome>;

inline bool isEligible(const RegionOutcome& outcome) {
    return std::holds_alternative<Eligible>(outcome);
}

/**
 * @brief Decide per template region whether it is blended
 *
 * A region is excluded when no face was found, when any of its anchors is in
 * the report's unreliable set, or when the aligner produced no transform.
 */
RegionPlan buildRegionPlan(const std::map<face::RegionName, SimilarityTransform>& transforms,
                           const face::ValidationReport& report,
                           const templates::Template& tmpl);

/// Every template region excluded with the same reason
RegionPlan excludeAllRegions(const templates::Template& tmpl, const std::string& reason);

std::string describeOutcome(const RegionOutcome& outcome);

} // namespace compose
} // namespace wojak
