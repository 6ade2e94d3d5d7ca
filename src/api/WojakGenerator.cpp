#include "wojak/api/WojakGenerator.hpp"
#include "wojak/core/Exception.hpp"
#include "wojak/core/Logger.hpp"
#include "wojak/utils/ImageCodec.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>

namespace wojak {
namespace api {

namespace {

constexpr float kMinContrast = 0.5f;
constexpr float kMaxContrast = 3.0f;

float clampParameter(const char* name, float value, float lo, float hi,
                     std::vector<std::string>* adjustments) {
    float clamped = std::clamp(value, lo, hi);
    if (!(value >= lo && value <= hi)) {
        // NaN compares false and ends up at lo
        if (value != value) {
            clamped = lo;
        }
        if (adjustments) {
            std::ostringstream oss;
            oss << name << "=" << value << " outside [" << lo << ", " << hi << "], using " << clamped;
            adjustments->push_back(oss.str());
        }
    }
    return clamped;
}

/// Reports transitions to the log and the caller's observer
class StateTracker {
public:
    StateTracker(const StateObserver& observer, const std::string& template_id)
        : observer_(observer), template_id_(template_id) {}

    void enter(GenerationState state) {
        state_ = state;
        WOJAK_LOG_DEBUG("WojakGenerator") << "[" << template_id_ << "] -> "
                                          << generationStateToString(state);
        if (observer_) {
            observer_(state);
        }
    }

    GenerationState state() const { return state_; }

private:
    const StateObserver& observer_;
    std::string template_id_;
    GenerationState state_ = GenerationState::IDLE;
};

} // namespace

// ---------------------------------------------------------------------------
// GenerationParameters
// ---------------------------------------------------------------------------

GenerationParameters GenerationParameters::normalized(std::vector<std::string>* adjustments) const {
    GenerationParameters p;
    p.face_blend_strength = clampParameter("face_blend_strength", face_blend_strength, 0.0f, 1.0f, adjustments);
    p.eye_blend_strength = clampParameter("eye_blend_strength", eye_blend_strength, 0.0f, 1.0f, adjustments);
    p.mouth_blend_strength = clampParameter("mouth_blend_strength", mouth_blend_strength, 0.0f, 1.0f, adjustments);
    p.nose_blend_strength = clampParameter("nose_blend_strength", nose_blend_strength, 0.0f, 1.0f, adjustments);
    p.color_match_strength = clampParameter("color_match_strength", color_match_strength, 0.0f, 1.0f, adjustments);
    p.contrast_enhancement = clampParameter("contrast_enhancement", contrast_enhancement,
                                            kMinContrast, kMaxContrast, adjustments);
    p.sharpen_amount = clampParameter("sharpen_amount", sharpen_amount, 0.0f, 1.0f, adjustments);
    return p;
}

GenerationParameters GenerationParameters::forTemplate(const templates::Template& tmpl) const {
    GenerationParameters p = *this;
    auto weightOf = [&tmpl](face::RegionName name) -> std::optional<float> {
        const templates::RegionDefinition* region = tmpl.region(name);
        return region ? region->default_weight : std::nullopt;
    };
    p.face_blend_strength = weightOf(face::RegionName::FACE).value_or(face_blend_strength);
    p.mouth_blend_strength = weightOf(face::RegionName::MOUTH).value_or(mouth_blend_strength);
    p.nose_blend_strength = weightOf(face::RegionName::NOSE).value_or(nose_blend_strength);
    auto eye = weightOf(face::RegionName::LEFT_EYE);
    if (!eye) {
        eye = weightOf(face::RegionName::RIGHT_EYE);
    }
    p.eye_blend_strength = eye.value_or(eye_blend_strength);
    return p;
}

compose::RegionStrengths GenerationParameters::strengths() const {
    compose::RegionStrengths s;
    s.face = face_blend_strength;
    s.eye = eye_blend_strength;
    s.mouth = mouth_blend_strength;
    s.nose = nose_blend_strength;
    return s;
}

std::string GenerationParameters::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "{face=" << face_blend_strength
        << " eye=" << eye_blend_strength
        << " mouth=" << mouth_blend_strength
        << " nose=" << nose_blend_strength
        << " color=" << color_match_strength
        << " contrast=" << contrast_enhancement
        << " sharpen=" << sharpen_amount << "}";
    return oss.str();
}

GenerationParameters GenerationParameters::passthrough() {
    GenerationParameters p;
    p.face_blend_strength = 0.0f;
    p.eye_blend_strength = 0.0f;
    p.mouth_blend_strength = 0.0f;
    p.nose_blend_strength = 0.0f;
    p.color_match_strength = 0.0f;
    p.contrast_enhancement = 1.0f;
    p.sharpen_amount = 0.0f;
    return p;
}

std::string generationStateToString(GenerationState state) {
    switch (state) {
        case GenerationState::IDLE:           return "Idle";
        case GenerationState::DETECTING:      return "Detecting";
        case GenerationState::VALIDATING:     return "Validating";
        case GenerationState::ALIGNING:       return "Aligning";
        case GenerationState::BLENDING:       return "Blending";
        case GenerationState::COLOR_MATCHING: return "ColorMatching";
        case GenerationState::DONE:           return "Done";
        case GenerationState::FAILED:         return "Failed";
        default:                              return "Unknown";
    }
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void LoggingConfig::apply() const {
    auto& logger = core::Logger::getInstance();
    core::LogLevel log_level = core::parseLogLevel(level, core::LogLevel::INFO);
    logger.setLevel(log_level);
    logger.setConsoleOutput(console);

    if (!file.empty()) {
        if (!logger.setLogFile(file)) {
            LOG_WARNING("Cannot open log file " + file + ", file logging disabled");
        }
    } else if (!directory.empty()) {
        if (logger.initializeWithTimestamp(directory, log_level)) {
            logger.setConsoleOutput(console);
        }
    }
}

GeneratorConfig GeneratorConfig::fromConfiguration(const core::Configuration& config) {
    GeneratorConfig c;

    // Detector
    c.detector.cascade_path = config.getString("detector.cascade_path", c.detector.cascade_path);
    c.detector.lbf_model_path = config.getString("detector.lbf_model_path", c.detector.lbf_model_path);
    c.detector.min_image_side = config.getInt("detector.min_image_side", c.detector.min_image_side);
    c.detector.scale_factor = config.getDouble("detector.scale_factor", c.detector.scale_factor);
    c.detector.min_neighbors = config.getInt("detector.min_neighbors", c.detector.min_neighbors);
    c.detector.min_face_size = config.getInt("detector.min_face_size", c.detector.min_face_size);

    // Validator
    auto& v = c.validator;
    v.high_resolution_min_side = config.getInt("validator.high_resolution_min_side", v.high_resolution_min_side);
    v.medium_resolution_min_side = config.getInt("validator.medium_resolution_min_side", v.medium_resolution_min_side);
    v.high_confidence = config.get<float>("validator.high_confidence", v.high_confidence);
    v.medium_confidence = config.get<float>("validator.medium_confidence", v.medium_confidence);
    v.min_point_confidence = config.get<float>("validator.min_point_confidence", v.min_point_confidence);
    v.max_yaw_deg = config.get<float>("validator.max_yaw_deg", v.max_yaw_deg);
    v.max_pitch_deg = config.get<float>("validator.max_pitch_deg", v.max_pitch_deg);
    v.max_roll_deg = config.get<float>("validator.max_roll_deg", v.max_roll_deg);
    v.frontal_nose_ratio = config.get<float>("validator.frontal_nose_ratio", v.frontal_nose_ratio);
    v.min_eye_distance_px = config.get<float>("validator.min_eye_distance_px", v.min_eye_distance_px);

    // Aligner / blender
    c.aligner.weight_by_confidence = config.getBool("aligner.weight_by_confidence", c.aligner.weight_by_confidence);
    c.aligner.min_anchor_spread_px = config.get<float>("aligner.min_anchor_spread_px", c.aligner.min_anchor_spread_px);
    c.aligner.collinearity_ratio = config.getDouble("aligner.collinearity_ratio", c.aligner.collinearity_ratio);
    c.blender.feather_radius_px = config.get<float>("blender.feather_radius_px", c.blender.feather_radius_px);

    // Generator
    c.template_directory = config.getString("generator.template_directory", c.template_directory);
    c.output_format = config.getString("generator.output_format", c.output_format);
    auto& d = c.defaults;
    d.face_blend_strength = config.get<float>("generator.defaults.face_blend_strength", d.face_blend_strength);
    d.eye_blend_strength = config.get<float>("generator.defaults.eye_blend_strength", d.eye_blend_strength);
    d.mouth_blend_strength = config.get<float>("generator.defaults.mouth_blend_strength", d.mouth_blend_strength);
    d.nose_blend_strength = config.get<float>("generator.defaults.nose_blend_strength", d.nose_blend_strength);
    d.color_match_strength = config.get<float>("generator.defaults.color_match_strength", d.color_match_strength);
    d.contrast_enhancement = config.get<float>("generator.defaults.contrast_enhancement", d.contrast_enhancement);
    d.sharpen_amount = config.get<float>("generator.defaults.sharpen_amount", d.sharpen_amount);

    // Logging
    c.logging.level = config.getString("logging.level", c.logging.level);
    c.logging.console = config.getBool("logging.console", c.logging.console);
    c.logging.file = config.getString("logging.file", c.logging.file);
    c.logging.directory = config.getString("logging.directory", c.logging.directory);

    return c;
}

bool GeneratorConfig::validate() const {
    return detector.validate() && validator.validate() && aligner.validate() && blender.validate() &&
           !output_format.empty() && output_format.front() == '.';
}

std::string GeneratorConfig::toString() const {
    std::ostringstream oss;
    oss << "GeneratorConfig {\n";
    oss << detector.toString() << "\n";
    oss << validator.toString() << "\n";
    oss << aligner.toString() << "\n";
    oss << blender.toString() << "\n";
    oss << "template_directory: " << template_directory << "\n";
    oss << "output_format: " << output_format << "\n";
    oss << "defaults: " << defaults.toString() << "\n";
    oss << "logging: level=" << logging.level << " console=" << (logging.console ? "on" : "off")
        << " file=" << logging.file << " directory=" << logging.directory << "\n";
    oss << "}";
    return oss.str();
}

// ---------------------------------------------------------------------------
// WojakGenerator
// ---------------------------------------------------------------------------

WojakGenerator::WojakGenerator(std::shared_ptr<const templates::TemplateRegistry> registry,
                               std::shared_ptr<const face::LandmarkBackend> backend,
                               const GeneratorConfig& config)
    : registry_(std::move(registry))
    , config_(config)
    , detector_(std::move(backend), config.detector.min_image_side)
    , validator_(config.validator)
    , aligner_(config.aligner)
    , blender_(config.blender) {
    if (!registry_) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                    "WojakGenerator requires a template registry");
    }
    if (!config_.validate()) {
        LOG_WARNING("Generator configuration failed validation; components fell back to defaults");
    }
}

GenerationResult WojakGenerator::generate(const std::vector<uint8_t>& source_bytes,
                                          const std::string& template_id) const {
    // Unknown ids are reported by the full overload
    GenerationParameters params = registry_->contains(template_id)
                                      ? config_.defaults.forTemplate(registry_->get(template_id))
                                      : config_.defaults;
    return generate(source_bytes, template_id, params);
}

GenerationResult WojakGenerator::generate(const std::vector<uint8_t>& source_bytes,
                                          const std::string& template_id,
                                          const GenerationParameters& params,
                                          const StateObserver& observer) const {
    auto start_time = std::chrono::steady_clock::now();
    StateTracker tracker(observer, template_id);
    tracker.enter(GenerationState::IDLE);

    const templates::Template& tmpl = registry_->get(template_id);

    GenerationResult result;
    result.template_id = template_id;

    std::vector<std::string> adjustments;
    result.parameters = params.normalized(&adjustments);
    for (const auto& message : adjustments) {
        WOJAK_LOG_WARNING("WojakGenerator") << "Parameter clamped: " << message;
    }

    // Detecting
    tracker.enter(GenerationState::DETECTING);
    cv::Mat source;
    face::DetectionResult detection;
    try {
        source = utils::ImageCodec::decode(source_bytes);
        detection = detector_.detect(source);
    } catch (const core::DecodeException& e) {
        tracker.enter(GenerationState::FAILED);
        LOG_ERROR(std::string("Generation failed, source not decodable: ") + e.getMessage());
        throw;
    } catch (const core::ImageTooSmallException& e) {
        tracker.enter(GenerationState::FAILED);
        LOG_ERROR(std::string("Generation failed: ") + e.getMessage());
        throw;
    }

    // Validating
    tracker.enter(GenerationState::VALIDATING);
    face::RegionAnchors anchors;
    for (const auto& region : tmpl.regions) {
        anchors[region.name] = region.anchors;
    }
    result.validation = validator_.validate(detection.landmarks, source, detection.faces_detected, anchors);

    if (!detection.found()) {
        WOJAK_LOG_WARNING("WojakGenerator") << "No face in source image, returning template '"
                                            << template_id << "' unchanged";
        compose::RegionPlan plan = compose::excludeAllRegions(tmpl, "no face detected");
        for (const auto& entry : plan) {
            RegionReport region;
            region.region = entry.first;
            region.note = std::get<compose::Excluded>(entry.second).reason;
            result.regions.push_back(region);
        }
        result.image = tmpl.image.clone();
    } else {
        // Aligning
        tracker.enter(GenerationState::ALIGNING);
        auto transforms = aligner_.align(*detection.landmarks, tmpl);
        compose::RegionPlan plan = compose::buildRegionPlan(transforms, result.validation, tmpl);

        // Blending
        tracker.enter(GenerationState::BLENDING);
        compose::BlendResult blended = blender_.blend(source, tmpl, plan, result.parameters.strengths());

        for (const auto& info : blended.regions) {
            RegionReport region;
            region.region = info.region;
            region.blended = info.blended;
            region.note = info.note;
            auto it = plan.find(info.region);
            if (it != plan.end()) {
                if (const auto* eligible = std::get_if<compose::Eligible>(&it->second)) {
                    region.translation_only = eligible->transform.translation_only;
                    region.residual_px = eligible->transform.residual_rms;
                }
            }
            result.regions.push_back(region);
        }

        // Color matching and final tone
        tracker.enter(GenerationState::COLOR_MATCHING);
        cv::Mat image = matcher_.match(blended.image, blended.regions, tmpl.palette,
                                       result.parameters.color_match_strength);
        image = compose::ColorMatcher::sharpen(image, result.parameters.sharpen_amount);
        result.image = compose::ColorMatcher::enhanceContrast(image, result.parameters.contrast_enhancement);
    }

    try {
        result.image_bytes = utils::ImageCodec::encode(result.image, config_.output_format);
    } catch (const core::Exception& e) {
        tracker.enter(GenerationState::FAILED);
        LOG_ERROR(std::string("Generation failed, cannot encode output: ") + e.getMessage());
        throw;
    }

    tracker.enter(GenerationState::DONE);
    result.state = tracker.state();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    size_t blended_count = std::count_if(result.regions.begin(), result.regions.end(),
                                         [](const RegionReport& r) { return r.blended; });
    WOJAK_LOG_INFO("WojakGenerator") << "Generated '" << template_id << "' "
                                     << result.image.cols << "x" << result.image.rows
                                     << " valid=" << (result.validation.valid ? "true" : "false")
                                     << " quality=" << face::imageQualityToString(result.validation.image_quality)
                                     << " regions=" << blended_count << "/" << result.regions.size()
                                     << " params=" << result.parameters.toString()
                                     << " in " << elapsed.count() << " ms";
    return result;
}

face::ValidationReport WojakGenerator::validateFaceImage(const std::vector<uint8_t>& source_bytes) const {
    cv::Mat source = utils::ImageCodec::decode(source_bytes);
    face::DetectionResult detection = detector_.detect(source);
    return validator_.validate(detection.landmarks, source, detection.faces_detected);
}

std::vector<templates::TemplateSummary> WojakGenerator::listTemplates() const {
    return registry_->list();
}

} // namespace api
} // namespace wojak
