#pragma once

#include "wojak/face/FaceTypes.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wojak {
namespace face {

/**
 * @brief Landmark detector configuration
 */
struct DetectorConfig {
    // Model configuration
    std::string cascade_path;          ///< Haar cascade for face boxes (empty: search OpenCV data dirs)
    std::string lbf_model_path;        ///< FacemarkLBF 68-point model (lbfmodel.yaml)

    // Detection parameters
    int min_image_side = 64;           ///< Images with a smaller side are rejected
    double scale_factor = 1.1;         ///< Cascade pyramid scale step
    int min_neighbors = 4;             ///< Cascade neighbour threshold
    int min_face_size = 40;            ///< Minimum face box side in pixels

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Pluggable face/landmark detection capability
 *
 * Implementations report every face they find, each with 68 points in the
 * iBUG 300-W order. detectFaces() may be called from several threads at once.
 */
class LandmarkBackend {
public:
    virtual ~LandmarkBackend() = default;

    /**
     * @brief Detect faces and their landmarks
     * @param image BGR image (CV_8UC3)
     * @return Candidates in backend order, empty if no face
     */
    virtual std::vector<FaceCandidate> detectFaces(const cv::Mat& image) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief OpenCV backend: Haar cascade face boxes plus FacemarkLBF landmarks
 *
 * Per-point confidence is estimated from the local gradient magnitude around
 * each fitted landmark. The cascade and facemark objects are not reentrant and
 * are guarded by a mutex.
 */
class FacemarkBackend : public LandmarkBackend {
public:
    explicit FacemarkBackend(const DetectorConfig& config = DetectorConfig());
    ~FacemarkBackend() override;

    FacemarkBackend(const FacemarkBackend&) = delete;
    FacemarkBackend& operator=(const FacemarkBackend&) = delete;

    /**
     * @brief Load cascade and landmark model
     * @return false on failure, see getLastError()
     */
    bool initialize();

    bool isInitialized() const;

    std::string getLastError() const;

    std::vector<FaceCandidate> detectFaces(const cv::Mat& image) const override;

    std::string name() const override { return "facemark_lbf"; }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Outcome of a detection call
 *
 * "No face" is a normal outcome: landmarks is empty and faces_detected is 0.
 */
struct DetectionResult {
    std::optional<LandmarkSet> landmarks;  ///< Chosen face, fully populated or absent
    int faces_detected = 0;                ///< Faces the backend reported
    FaceBoundingBox face;                  ///< Bounding box of the chosen face

    bool found() const { return landmarks.has_value(); }
};

/**
 * @brief Detects the dominant face in an image and maps it to the named schema
 *
 * The largest face wins; equal areas are ordered by smaller y, then smaller x.
 * Candidates with an incomplete or non-finite 68-point vector are discarded
 * before selection.
 */
class LandmarkDetector {
public:
    explicit LandmarkDetector(std::shared_ptr<const LandmarkBackend> backend,
                              int min_image_side = 64);

    /**
     * @brief Detect landmarks of the dominant face
     * @throws core::ImageTooSmallException if either side is below the minimum
     */
    DetectionResult detect(const cv::Mat& image) const;

    int getMinImageSide() const { return min_image_side_; }

    /**
     * @brief Map 68 iBUG points to the canonical named landmark set
     * @return std::nullopt if the vector is not exactly 68 finite points
     */
    static std::optional<LandmarkSet> fromIbug68(const std::vector<LandmarkPoint2D>& points68);

    /**
     * @brief Index of the dominant candidate, -1 if none is usable
     */
    static int selectDominantFace(const std::vector<FaceCandidate>& candidates);

private:
    std::shared_ptr<const LandmarkBackend> backend_;
    int min_image_side_;
};

} // namespace face
} // namespace wojak
