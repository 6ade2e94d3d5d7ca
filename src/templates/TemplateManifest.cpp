#include "wojak/templates/TemplateManifest.hpp"
#include "wojak/core/Exception.hpp"
#include "wojak/core/Logger.hpp"
#include "wojak/utils/FileUtils.hpp"
#include "wojak/utils/ImageCodec.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace wojak {
namespace templates {

namespace {

cv::Point2f readPoint(const YAML::Node& node) {
    if (!node.IsSequence() || node.size() != 2) {
        throw YAML::Exception(node.Mark(), "expected [x, y]");
    }
    return cv::Point2f(node[0].as<float>(), node[1].as<float>());
}

std::vector<cv::Point> readPolygon(const YAML::Node& node) {
    if (!node.IsSequence() || node.size() < 3) {
        throw YAML::Exception(node.Mark(), "polygon needs at least 3 points");
    }
    std::vector<cv::Point> polygon;
    for (const auto& item : node) {
        cv::Point2f p = readPoint(item);
        polygon.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
    }
    return polygon;
}

TemplateGeometry readGeometry(const YAML::Node& node, const std::string& fallback_preset) {
    std::string preset = node["preset"] ? node["preset"].as<std::string>() : fallback_preset;
    TemplateGeometry g = TemplateGeometry::builtin(preset);

    if (node["canvas"]) {
        cv::Point2f c = readPoint(node["canvas"]);
        g.canvas = cv::Size(static_cast<int>(c.x), static_cast<int>(c.y));
    }
    if (const YAML::Node head = node["head"]) {
        if (head["center"]) g.head_center = readPoint(head["center"]);
        if (head["radius"]) g.head_radius = head["radius"].as<float>();
    }
    if (node["left_eye"]) g.left_eye = readPoint(node["left_eye"]);
    if (node["right_eye"]) g.right_eye = readPoint(node["right_eye"]);
    if (node["eye_radius"]) g.eye_radius = node["eye_radius"].as<float>();
    if (node["nose"]) g.nose = readPoint(node["nose"]);
    if (const YAML::Node mouth = node["mouth"]) {
        if (mouth["center"]) g.mouth = readPoint(mouth["center"]);
        if (mouth["axes"]) {
            cv::Point2f axes = readPoint(mouth["axes"]);
            g.mouth_axes = cv::Size2f(axes.x, axes.y);
        }
    }

    if (g.head_radius <= 0.0f || g.eye_radius <= 0.0f ||
        g.mouth_axes.width <= 0.0f || g.mouth_axes.height <= 0.0f) {
        throw YAML::Exception(node.Mark(), "geometry radii and axes must be positive");
    }
    if (g.left_eye.x >= g.right_eye.x) {
        throw YAML::Exception(node.Mark(), "left_eye must be left of right_eye");
    }
    return g;
}

ManifestEntry readEntry(const YAML::Node& node) {
    ManifestEntry entry;
    if (!node.IsMap() || !node["id"]) {
        throw YAML::Exception(node.Mark(), "entry without id");
    }
    entry.id = node["id"].as<std::string>();
    entry.display_name = node["display_name"] ? node["display_name"].as<std::string>()
                                              : displayNameFromId(entry.id);
    entry.description = node["description"] ? node["description"].as<std::string>()
                                            : entry.id + " variant";
    entry.image = node["image"] ? node["image"].as<std::string>() : entry.id + ".png";

    if (const YAML::Node geometry = node["geometry"]) {
        entry.geometry_preset = geometry["preset"] ? geometry["preset"].as<std::string>() : std::string();
        // A block with more than a preset is an explicit layout
        if (geometry.size() > (geometry["preset"] ? 1u : 0u)) {
            entry.geometry = readGeometry(geometry, entry.id);
        }
    }

    if (const YAML::Node landmarks = node["landmarks"]) {
        const auto& names = face::canonicalLandmarkNames();
        for (const auto& kv : landmarks) {
            std::string name = kv.first.as<std::string>();
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                throw YAML::Exception(kv.first.Mark(), "unknown landmark '" + name + "'");
            }
            entry.landmark_overrides[name] = readPoint(kv.second);
        }
    }

    if (const YAML::Node regions = node["regions"]) {
        for (const auto& kv : regions) {
            std::string name = kv.first.as<std::string>();
            auto region = face::regionNameFromString(name);
            if (!region) {
                throw YAML::Exception(kv.first.Mark(), "unknown region '" + name + "'");
            }
            RegionOverride override_def;
            if (kv.second["anchors"]) {
                override_def.anchors = kv.second["anchors"].as<std::vector<std::string>>();
            }
            if (kv.second["polygon"]) {
                override_def.polygon = readPolygon(kv.second["polygon"]);
            }
            if (kv.second["weight"]) {
                override_def.weight = std::clamp(kv.second["weight"].as<float>(), 0.0f, 1.0f);
            }
            entry.region_overrides[*region] = override_def;
        }
    }
    return entry;
}

YAML::Node entryToNode(const ManifestEntry& entry) {
    YAML::Node node;
    node["id"] = entry.id;
    node["display_name"] = entry.display_name;
    node["description"] = entry.description;
    node["image"] = entry.image;
    if (!entry.geometry_preset.empty()) {
        node["geometry"]["preset"] = entry.geometry_preset;
    }
    return node;
}

bool isValidId(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '_' || c == '-';
    });
}

} // namespace

std::string displayNameFromId(const std::string& id) {
    std::string name;
    bool capitalize = true;
    for (char c : id) {
        if (c == '_' || c == '-') {
            name += ' ';
            capitalize = true;
        } else if (capitalize) {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            capitalize = false;
        } else {
            name += c;
        }
    }
    return name;
}

std::vector<ManifestEntry> builtinManifest() {
    struct Info { const char* id; const char* name; const char* description; };
    static const Info infos[] = {
        {"wojak_basic", "Basic Wojak", "Classic Wojak face"},
        {"pointer_wojak", "Pointer Wojak", "Wojak pointing with finger"},
        {"doomer", "Doomer", "Depressed night-walking Wojak"},
        {"soyjak", "Soyjak", "Soy-consuming variant"},
        {"brainlet", "Brainlet", "Low IQ Wojak variant"}
    };

    std::vector<ManifestEntry> entries;
    for (const auto& info : infos) {
        ManifestEntry entry;
        entry.id = info.id;
        entry.display_name = info.name;
        entry.description = info.description;
        entry.image = std::string(info.id) + ".png";
        entries.push_back(entry);
    }
    return entries;
}

std::optional<std::vector<ManifestEntry>> readManifest(const std::string& directory) {
    const std::string path = (std::filesystem::path(directory) / kManifestFileName).string();
    if (!utils::FileUtils::fileExists(path)) {
        return std::nullopt;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Cannot parse template manifest " + path + ": " + e.what());
        return std::nullopt;
    }

    const YAML::Node list = root["templates"];
    if (!list || !list.IsSequence()) {
        LOG_ERROR("Template manifest " + path + " has no 'templates' list");
        return std::nullopt;
    }

    std::vector<ManifestEntry> entries;
    for (size_t i = 0; i < list.size(); ++i) {
        try {
            ManifestEntry entry = readEntry(list[i]);
            bool duplicate = std::any_of(entries.begin(), entries.end(),
                                         [&](const ManifestEntry& e) { return e.id == entry.id; });
            if (duplicate) {
                LOG_ERROR("Template manifest entry " + std::to_string(i) + ": duplicate id '" +
                          entry.id + "', skipped");
                continue;
            }
            entries.push_back(std::move(entry));
        } catch (const YAML::Exception& e) {
            LOG_ERROR("Template manifest entry " + std::to_string(i) + " skipped: " + e.what());
        }
    }
    return entries;
}

void appendManifestEntry(const std::string& directory,
                         const std::string& source_image_path,
                         const ManifestEntry& entry) {
    namespace fs = std::filesystem;

    if (!isValidId(entry.id)) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                    "Template id '" + entry.id + "' must be lower-case letters, digits, '_' or '-'");
    }
    if (!utils::ImageCodec::isSupportedExtension(source_image_path)) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                    "Unsupported image type: " + source_image_path);
    }
    if (!utils::FileUtils::fileExists(source_image_path)) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                    "Image not found: " + source_image_path);
    }
    if (!utils::FileUtils::createDirectory(directory)) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_IO,
                    "Cannot create template directory: " + directory);
    }

    const fs::path manifest_path = fs::path(directory) / kManifestFileName;
    YAML::Node root;
    if (fs::exists(manifest_path)) {
        try {
            root = YAML::LoadFile(manifest_path.string());
        } catch (const YAML::Exception& e) {
            WOJAK_THROW(core::FileException, core::ResultCode::ERROR_CONFIG_INVALID,
                        "Cannot parse " + manifest_path.string() + ": " + e.what());
        }
    } else {
        for (const auto& builtin : builtinManifest()) {
            root["templates"].push_back(entryToNode(builtin));
        }
    }

    for (const auto& existing : root["templates"]) {
        if (existing["id"] && existing["id"].as<std::string>() == entry.id) {
            WOJAK_THROW(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                        "Template '" + entry.id + "' already exists");
        }
    }

    ManifestEntry stored = entry;
    stored.image = entry.id + utils::FileUtils::getFileExtension(source_image_path);
    if (stored.display_name.empty()) {
        stored.display_name = displayNameFromId(entry.id);
    }
    if (stored.description.empty()) {
        stored.description = stored.display_name + " template";
    }

    const fs::path target = fs::path(directory) / stored.image;
    std::error_code ec;
    fs::copy_file(source_image_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_IO,
                    "Cannot copy " + source_image_path + " to " + target.string() + ": " + ec.message());
    }

    root["templates"].push_back(entryToNode(stored));

    YAML::Emitter emitter;
    emitter << root;
    std::ofstream out(manifest_path);
    if (!out.is_open()) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_IO,
                    "Cannot write " + manifest_path.string());
    }
    out << emitter.c_str() << '\n';
    if (!out.good()) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_IO,
                    "Error writing " + manifest_path.string());
    }

    LOG_INFO("Added template '" + stored.id + "' (" + target.string() + ")");
}

} // namespace templates
} // namespace wojak
