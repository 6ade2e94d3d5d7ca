#include "wojak/compose/RegionPlan.hpp"
#include <sstream>

namespace wojak {
namespace compose {

RegionPlan buildRegionPlan(const std::map<face::RegionName, SimilarityTransform>& transforms,
                           const face::ValidationReport& report,
                           const templates::Template& tmpl) {
    if (!report.face_detected) {
        return excludeAllRegions(tmpl, "no face detected");
    }

    RegionPlan plan;
    for (const auto& region : tmpl.regions) {
        std::string unreliable;
        for (const auto& anchor : region.anchors) {
            if (report.unreliable_landmarks.count(anchor) != 0) {
                unreliable += (unreliable.empty() ? "" : ", ") + anchor;
            }
        }
        if (!unreliable.empty()) {
            plan[region.name] = Excluded{"unreliable landmarks: " + unreliable};
            continue;
        }

        auto it = transforms.find(region.name);
        if (it == transforms.end()) {
            plan[region.name] = Excluded{"no alignment"};
            continue;
        }
        plan[region.name] = Eligible{it->second};
    }
    return plan;
}

RegionPlan excludeAllRegions(const templates::Template& tmpl, const std::string& reason) {
    RegionPlan plan;
    for (const auto& region : tmpl.regions) {
        plan[region.name] = Excluded{reason};
    }
    return plan;
}

std::string describeOutcome(const RegionOutcome& outcome) {
    if (const auto* eligible = std::get_if<Eligible>(&outcome)) {
        std::ostringstream oss;
        oss << "eligible (scale " << eligible->transform.scale()
            << ", residual " << eligible->transform.residual_rms << " px"
            << (eligible->transform.translation_only ? ", translation only" : "") << ")";
        return oss.str();
    }
    return "excluded: " + std::get<Excluded>(outcome).reason;
}

} // namespace compose
} // namespace wojak
