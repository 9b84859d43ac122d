#include "annokit/config/AppConfig.hpp"

#include <filesystem>

#include "annokit/common/log.hpp"
#include "annokit/post/Postprocess.hpp"

namespace annokit::config {

interaction::SessionConfig AppConfig::sessionConfig() const {
    interaction::SessionConfig cfg;
    cfg.min_box_px = min_box_px;
    cfg.min_resize_px = min_resize_px;
    cfg.container = cv::Size(container_width, container_height);
    return cfg;
}

std::vector<std::string> AppConfig::resolveClassNames() const {
    if (!inline_class_names.empty()) {
        return inline_class_names;
    }
    if (!classes_path.empty()) {
        return post::Postprocess::loadClassNames(classes_path);
    }
    return {};
}

void applyConfig(const YAML::Node& yaml, AppConfig& config) {
    if (yaml["logging"]) {
        const auto& logging = yaml["logging"];
        if (logging["level"]) {
            config.log_level = logging["level"].as<std::string>(config.log_level);
        }
    } else if (yaml["log_level"]) {
        config.log_level = yaml["log_level"].as<std::string>(config.log_level);
    }

    if (yaml["interaction"]) {
        const auto& inter = yaml["interaction"];
        config.min_box_px = inter["min_box_px"].as<double>(config.min_box_px);
        config.min_resize_px = inter["min_resize_px"].as<double>(config.min_resize_px);
    }

    if (yaml["view"]) {
        const auto& view = yaml["view"];
        if (view["container"] && view["container"].IsSequence() && view["container"].size() == 2) {
            config.container_width = view["container"][0].as<int>(config.container_width);
            config.container_height = view["container"][1].as<int>(config.container_height);
        }
    }

    if (yaml["classes"]) {
        const auto& cls = yaml["classes"];
        if (cls.IsScalar()) {
            config.classes_path = cls.as<std::string>();
            config.inline_class_names.clear();
        } else if (cls.IsSequence()) {
            config.classes_path.clear();
            config.inline_class_names.clear();
            for (const auto& node : cls) {
                config.inline_class_names.push_back(node.as<std::string>());
            }
        } else if (cls.IsMap()) {
            if (cls["path"]) {
                config.classes_path = cls["path"].as<std::string>(config.classes_path);
            }
            if (cls["names"] && cls["names"].IsSequence()) {
                config.inline_class_names.clear();
                for (const auto& node : cls["names"]) {
                    config.inline_class_names.push_back(node.as<std::string>());
                }
                if (!cls["path"]) {
                    config.classes_path.clear();
                }
            }
        }
    }

    if (yaml["io"]) {
        const auto& io = yaml["io"];
        config.images_dir = io["images"].as<std::string>(config.images_dir);
        config.detections_dir = io["detections"].as<std::string>(config.detections_dir);
        config.labels_dir = io["labels"].as<std::string>(config.labels_dir);
        config.events_path = io["events"].as<std::string>(config.events_path);
        config.overlays_dir = io["overlays"].as<std::string>(config.overlays_dir);
    }
}

AppConfig loadConfig(const std::string& path) {
    AppConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOGW("Configuration file not found: ", path, ", using defaults");
        return config;
    }

    try {
        const YAML::Node yaml = YAML::LoadFile(path);
        AppConfig loaded;
        applyConfig(yaml, loaded);
        config = loaded;
        LOGI("Loaded configuration from ", path);
    } catch (const YAML::Exception& e) {
        LOGE("Error loading config '", path, "': ", e.what(), ". Using defaults.");
    }
    return config;
}

} // namespace annokit::config
