#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "annokit/infer/IDetectionProvider.hpp"
#include "annokit/store/AnnotatedObject.hpp"

namespace annokit::post {

class Postprocess {
public:
    // Divides absolute xyxy boxes by the image size. Non-positive sizes leave
    // the detections untouched and return false.
    static bool rescaleToNormalized(std::vector<infer::Detection>& detections,
                                    const cv::Size& image_size);

    /**
     * @brief Convert a detection result into store objects
     *
     * Class names are resolved against (and appended to) @p classes. Box
     * corners are reordered so x1 <= x2, y1 <= y2 and confidence is clamped
     * to [0,1]. Detections with non-finite coordinates or no usable class are
     * skipped with a warning.
     */
    static std::vector<store::AnnotatedObject> toObjects(const infer::DetectionResult& result,
                                                         std::vector<std::string>& classes);

    static geometry::NormBox orderCorners(const geometry::NormBox& box);

    static std::vector<std::string> loadClassNames(const std::string& path);
};

} // namespace annokit::post
