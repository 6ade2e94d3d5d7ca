#include "wojak/templates/TemplateRegistry.hpp"
#include "wojak/compose/ColorMatcher.hpp"
#include "wojak/core/Exception.hpp"
#include "wojak/core/Logger.hpp"
#include "wojak/utils/FileUtils.hpp"
#include "wojak/utils/ImageCodec.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>
#include <set>

namespace wojak {
namespace templates {

namespace {

constexpr int kThumbnailSize = 150;

face::LandmarkSet applyLandmarkOverrides(const face::LandmarkSet& base,
                                         const std::map<std::string, cv::Point2f>& overrides) {
    if (overrides.empty()) {
        return base;
    }
    std::vector<face::NamedLandmark> points = base.points();
    for (auto& named : points) {
        auto it = overrides.find(named.name);
        if (it != overrides.end()) {
            named.point.x = it->second.x;
            named.point.y = it->second.y;
        }
    }
    auto set = face::LandmarkSet::create(std::move(points), base.outline());
    return set ? *set : base;
}

void applyRegionOverrides(std::vector<RegionDefinition>& regions,
                          const std::map<face::RegionName, RegionOverride>& overrides,
                          const std::string& template_id) {
    const auto& names = face::canonicalLandmarkNames();
    for (auto& region : regions) {
        auto it = overrides.find(region.name);
        if (it == overrides.end()) {
            continue;
        }
        const RegionOverride& o = it->second;
        if (o.anchors) {
            bool known = !o.anchors->empty() &&
                         std::all_of(o.anchors->begin(), o.anchors->end(), [&](const std::string& a) {
                             return std::find(names.begin(), names.end(), a) != names.end();
                         });
            if (known) {
                region.anchors = *o.anchors;
            } else {
                LOG_ERROR("Template '" + template_id + "': unknown anchor in region '" +
                          face::regionNameToString(region.name) + "', keeping defaults");
            }
        }
        if (o.polygon) {
            region.mask_polygon = *o.polygon;
        }
        if (o.weight) {
            region.default_weight = *o.weight;
        }
    }
}

} // namespace

Template TemplateRegistry::buildTemplate(const ManifestEntry& entry, const std::string& directory) {
    Template tmpl;
    tmpl.id = entry.id;
    tmpl.display_name = entry.display_name.empty() ? displayNameFromId(entry.id) : entry.display_name;
    tmpl.description = entry.description;

    const std::string preset = entry.geometry_preset.empty() ? entry.id : entry.geometry_preset;
    TemplateGeometry geometry = entry.geometry ? *entry.geometry : TemplateGeometry::builtin(preset);

    if (!directory.empty() && !entry.image.empty()) {
        tmpl.image_path = (std::filesystem::path(directory) / entry.image).string();
        tmpl.image = utils::ImageCodec::load(tmpl.image_path);
    }

    if (tmpl.image.empty()) {
        tmpl.image = renderPlaceholder(preset, geometry.canvas);
        tmpl.source = TemplateSource::PLACEHOLDER;
        if (!tmpl.image_path.empty()) {
            LOG_WARNING("Template image missing, using placeholder: " + tmpl.image_path);
        }
    } else {
        tmpl.source = TemplateSource::ASSET;
    }

    geometry = geometry.scaledTo(tmpl.image.size());
    tmpl.landmarks = applyLandmarkOverrides(landmarksFromGeometry(geometry), entry.landmark_overrides);
    tmpl.regions = regionsFromGeometry(geometry);
    applyRegionOverrides(tmpl.regions, entry.region_overrides, entry.id);

    for (const auto& region : tmpl.regions) {
        cv::Mat mask = cv::Mat::zeros(tmpl.image.size(), CV_8U);
        std::vector<std::vector<cv::Point>> polys = {region.mask_polygon};
        cv::fillPoly(mask, polys, cv::Scalar(255));
        tmpl.palette[region.name] = compose::ColorMatcher::measure(tmpl.image, mask);
    }

    tmpl.thumbnail_png = utils::ImageCodec::encode(utils::ImageCodec::thumbnail(tmpl.image, kThumbnailSize),
                                                   ".png");
    return tmpl;
}

std::shared_ptr<const TemplateRegistry> TemplateRegistry::fromEntries(const std::vector<ManifestEntry>& entries,
                                                                      const std::string& directory) {
    std::shared_ptr<TemplateRegistry> registry(new TemplateRegistry());
    registry->directory_ = directory;

    for (const auto& entry : entries) {
        if (registry->contains(entry.id)) {
            LOG_ERROR("Duplicate template id '" + entry.id + "' skipped");
            continue;
        }
        try {
            registry->add(buildTemplate(entry, directory));
        } catch (const core::Exception& e) {
            LOG_ERROR("Template '" + entry.id + "' skipped: " + e.what());
        } catch (const cv::Exception& e) {
            LOG_ERROR("Template '" + entry.id + "' skipped (OpenCV): " + e.what());
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("Template '" + entry.id + "' skipped: " + e.what());
        }
    }
    return registry;
}

std::shared_ptr<const TemplateRegistry> TemplateRegistry::loadAll(const std::string& directory) {
    std::vector<ManifestEntry> entries;
    auto manifest = directory.empty() ? std::nullopt : readManifest(directory);
    if (manifest) {
        entries = *manifest;
    } else {
        entries = builtinManifest();
    }

    // Images the manifest does not name
    std::set<std::string> named_files;
    for (const auto& entry : entries) {
        named_files.insert(std::filesystem::path(entry.image).filename().string());
    }
    for (const auto& path : utils::FileUtils::listFiles(directory)) {
        std::string filename = std::filesystem::path(path).filename().string();
        if (!utils::ImageCodec::isSupportedExtension(path) || named_files.count(filename) != 0) {
            continue;
        }
        ManifestEntry extra;
        extra.id = utils::FileUtils::getStem(path);
        extra.display_name = displayNameFromId(extra.id);
        extra.description = extra.id + " variant";
        extra.image = filename;
        extra.geometry_preset = "wojak_basic";
        entries.push_back(extra);
    }

    auto registry = fromEntries(entries, directory);
    WOJAK_LOG_INFO("TemplateRegistry") << "Loaded " << registry->size() << " template(s) from "
                                       << (directory.empty() ? "<built-in>" : directory)
                                       << (manifest ? " (manifest)" : "");
    return registry;
}

void TemplateRegistry::add(Template tmpl) {
    index_[tmpl.id] = templates_.size();
    templates_.push_back(std::move(tmpl));
}

const Template& TemplateRegistry::get(const std::string& template_id) const {
    auto it = index_.find(template_id);
    if (it == index_.end()) {
        WOJAK_THROW(core::TemplateNotFoundException, template_id);
    }
    return templates_[it->second];
}

bool TemplateRegistry::contains(const std::string& template_id) const {
    return index_.count(template_id) != 0;
}

std::vector<TemplateSummary> TemplateRegistry::list() const {
    std::vector<TemplateSummary> summaries;
    summaries.reserve(templates_.size());
    for (const auto& tmpl : templates_) {
        summaries.push_back(TemplateSummary{tmpl.id, tmpl.display_name, tmpl.description, tmpl.thumbnail_png});
    }
    return summaries;
}

std::vector<std::string> TemplateRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(templates_.size());
    for (const auto& tmpl : templates_) {
        result.push_back(tmpl.id);
    }
    return result;
}

} // namespace templates
} // namespace wojak
