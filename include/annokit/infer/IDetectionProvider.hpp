#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "annokit/geometry/CoordTransform.hpp"

namespace annokit::infer {

enum class Workflow {
    PROMPT_FREE,
    TEXT_PROMPT,
    IMAGE_PROMPT
};

// Boxes drawn by the user as prompts for image-prompted detection.
struct VisualPrompt {
    std::vector<geometry::NormBox> bboxes;
    std::vector<int> cls;   // same length as bboxes
};

struct DetectionPrompt {
    Workflow workflow = Workflow::PROMPT_FREE;
    std::vector<std::string> text;   // class names for TEXT_PROMPT
    VisualPrompt visual;             // for IMAGE_PROMPT
};

struct Detection {
    int class_id = -1;                     // index into DetectionResult::classes, -1 if by name
    std::string class_name;
    float confidence = 0.0f;               // [0-1]
    geometry::NormBox bbox;                // normalized corners
    std::optional<geometry::Mask> mask;    // absolute polygon
};

struct DetectionResult {
    std::vector<std::string> classes;
    std::vector<Detection> detections;
};

/**
 * @brief Source of detections for one image
 *
 * A returned result replaces the image's whole object set. nullopt means the
 * detector failed; callers surface it as an empty set plus a message.
 */
class IDetectionProvider {
public:
    virtual ~IDetectionProvider() = default;

    virtual std::optional<DetectionResult> detect(const std::string& image_path,
                                                  const cv::Size& image_size,
                                                  const DetectionPrompt& prompt) = 0;
    virtual std::string name() const = 0;
};

using DetectionProviderPtr = std::unique_ptr<IDetectionProvider>;

} // namespace annokit::infer
