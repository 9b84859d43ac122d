#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "annokit/interaction/InteractionTypes.hpp"

namespace annokit::config {

struct AppConfig {
    std::string log_level = "INFO";

    // Interaction thresholds and viewport
    double min_box_px = 5.0;
    double min_resize_px = 5.0;
    int container_width = 0;
    int container_height = 0;

    // Class vocabulary: file path and/or inline names (inline wins)
    std::string classes_path;
    std::vector<std::string> inline_class_names;

    // I/O locations
    std::string images_dir;
    std::string detections_dir;
    std::string labels_dir = "labels";
    std::string events_path;
    std::string overlays_dir;

    interaction::SessionConfig sessionConfig() const;

    // Inline names if any, otherwise the contents of classes_path.
    std::vector<std::string> resolveClassNames() const;
};

/**
 * @brief Load configuration from YAML
 *
 * A missing file yields defaults with a warning; a parse error yields
 * defaults with an error log. Never throws.
 */
AppConfig loadConfig(const std::string& path);

// Apply the keys present in @p root on top of @p config.
void applyConfig(const YAML::Node& root, AppConfig& config);

} // namespace annokit::config
