#pragma once

#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "annokit/infer/IDetectionProvider.hpp"

namespace annokit::infer {

/**
 * @brief Reads detector output saved next to the images
 *
 * Looks up <dir>/<image stem>.json|.yaml|.yml. Two layouts are accepted:
 *
 * @code
 *   # object form, normalized corners
 *   classes: [person, car]
 *   objects:
 *     - {class_id: 0, confidence: 0.9, bbox: [0.1, 0.2, 0.4, 0.8], mask: [[10, 20], [30, 40]]}
 *
 *   # detector summary form, absolute xyxy corners
 *   class: [person]
 *   conf: [0.9]
 *   bbox: [[64, 96, 256, 384]]
 *   masks: [[[70, 100], [250, 100], [250, 380]]]
 * @endcode
 *
 * JSON files are parsed through yaml-cpp as flow-style YAML.
 */
class DetectionFileProvider : public IDetectionProvider {
public:
    explicit DetectionFileProvider(std::string directory);

    std::optional<DetectionResult> detect(const std::string& image_path,
                                          const cv::Size& image_size,
                                          const DetectionPrompt& prompt) override;
    std::string name() const override { return "file"; }

    // Path of the detection file for an image, empty when none exists.
    std::string findFileFor(const std::string& image_path) const;

    static std::optional<DetectionResult> loadFile(const std::string& path, const cv::Size& image_size);
    static std::optional<DetectionResult> parse(const YAML::Node& root, const cv::Size& image_size);

private:
    std::string directory_;
};

} // namespace annokit::infer
