#pragma once

#include "wojak/compose/ColorMatcher.hpp"
#include "wojak/compose/GeometricAligner.hpp"
#include "wojak/compose/RegionBlender.hpp"
#include "wojak/compose/RegionPlan.hpp"
#include "wojak/core/Configuration.hpp"
#include "wojak/face/FaceValidator.hpp"
#include "wojak/face/LandmarkDetector.hpp"
#include "wojak/templates/TemplateRegistry.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace wojak {
namespace api {

/**
 * @brief Per-request generation parameters
 *
 * Supplied with every request; never stored between requests.
 */
struct GenerationParameters {
    float face_blend_strength = 0.6f;    ///< Face outline region, [0,1]
    float eye_blend_strength = 0.8f;     ///< Both eye regions, [0,1]
    float mouth_blend_strength = 0.7f;   ///< Mouth region, [0,1]
    float nose_blend_strength = 0.3f;    ///< Nose region, [0,1]
    float color_match_strength = 0.4f;   ///< Pull toward template palette, [0,1]
    float contrast_enhancement = 1.1f;   ///< Contrast factor around mid-gray, [0.5,3.0]
    float sharpen_amount = 0.0f;         ///< Final sharpening mix, [0,1]

    /**
     * @brief Copy with every value clamped to its range
     * @param adjustments Receives one message per clamped value (optional)
     */
    GenerationParameters normalized(std::vector<std::string>* adjustments = nullptr) const;

    /**
     * @brief Copy with the template's authored region weights applied
     *
     * Regions without a weight keep this object's strength. The eye strength
     * comes from left_eye, or from right_eye when only that one is set.
     */
    GenerationParameters forTemplate(const templates::Template& tmpl) const;

    compose::RegionStrengths strengths() const;

    std::string toString() const;

    /// Parameters under which the output equals the template
    static GenerationParameters passthrough();
};

/**
 * @brief Pipeline states of one request
 */
enum class GenerationState {
    IDLE,
    DETECTING,
    VALIDATING,
    ALIGNING,
    BLENDING,
    COLOR_MATCHING,
    DONE,
    FAILED
};

std::string generationStateToString(GenerationState state);

/**
 * @brief Per-region outcome of a request
 */
struct RegionReport {
    face::RegionName region = face::RegionName::FACE;
    bool blended = false;
    bool translation_only = false;   ///< Alignment fell back to translation
    double residual_px = 0.0;        ///< Alignment RMS residual
    std::string note;                ///< Why the region was not blended
};

/**
 * @brief Result of a generation request
 */
struct GenerationResult {
    std::string template_id;
    cv::Mat image;                          ///< Composite, template size, BGR
    std::vector<uint8_t> image_bytes;       ///< Composite encoded in the output format
    face::ValidationReport validation;
    GenerationParameters parameters;        ///< Normalized parameters actually used
    std::vector<RegionReport> regions;      ///< In blend order
    GenerationState state = GenerationState::IDLE;
};

/**
 * @brief Logging settings read from the logging.* keys
 */
struct LoggingConfig {
    std::string level = "info";
    bool console = true;
    std::string file;        ///< Append to this file
    std::string directory;   ///< Or create a timestamped file here

    void apply() const;
};

/**
 * @brief Complete generator configuration
 */
struct GeneratorConfig {
    face::DetectorConfig detector;
    face::ValidatorConfig validator;
    compose::AlignerConfig aligner;
    compose::BlenderConfig blender;

    std::string template_directory = "assets/templates";
    std::string output_format = ".png";
    GenerationParameters defaults;

    LoggingConfig logging;

    /**
     * @brief Build from a loaded configuration, missing keys keep defaults
     */
    static GeneratorConfig fromConfiguration(const core::Configuration& config);

    bool validate() const;
    std::string toString() const;
};

/// Called on every state transition of a request
using StateObserver = std::function<void(GenerationState)>;

/**
 * @brief Public entry point of the compositing pipeline
 *
 * Sequences Detector -> Validator -> Aligner -> Blender -> Color matcher for
 * one request. Holds only read-only collaborators, so one instance can serve
 * concurrent requests.
 *
 * Terminal errors are thrown: core::TemplateNotFoundException before any
 * work, core::DecodeException and core::ImageTooSmallException from the
 * detecting stage. Everything else degrades into the validation report.
 */
class WojakGenerator {
public:
    WojakGenerator(std::shared_ptr<const templates::TemplateRegistry> registry,
                   std::shared_ptr<const face::LandmarkBackend> backend,
                   const GeneratorConfig& config = GeneratorConfig());

    /**
     * @brief Composite the face in source_bytes onto a template
     * @param source_bytes Encoded source photo
     * @param template_id Template identifier
     * @param params Generation parameters, clamped before use
     * @param observer Optional state transition callback
     */
    GenerationResult generate(const std::vector<uint8_t>& source_bytes,
                              const std::string& template_id,
                              const GenerationParameters& params,
                              const StateObserver& observer = nullptr) const;

    /// generate() with the configured defaults and the template's region weights
    GenerationResult generate(const std::vector<uint8_t>& source_bytes,
                              const std::string& template_id) const;

    /**
     * @brief Detection and validation only
     * @throws core::DecodeException, core::ImageTooSmallException
     */
    face::ValidationReport validateFaceImage(const std::vector<uint8_t>& source_bytes) const;

    std::vector<templates::TemplateSummary> listTemplates() const;

    const GeneratorConfig& getConfig() const { return config_; }

    std::shared_ptr<const templates::TemplateRegistry> getRegistry() const { return registry_; }

private:
    std::shared_ptr<const templates::TemplateRegistry> registry_;
    GeneratorConfig config_;

    face::LandmarkDetector detector_;
    face::FaceValidator validator_;
    compose::GeometricAligner aligner_;
    compose::RegionBlender blender_;
    compose::ColorMatcher matcher_;
};

} // namespace api
} // namespace wojak
