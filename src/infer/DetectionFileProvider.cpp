#include "annokit/infer/DetectionFileProvider.hpp"

#include <filesystem>
#include <utility>

#include "annokit/common/log.hpp"
#include "annokit/post/Postprocess.hpp"

namespace annokit::infer {

namespace {

std::optional<geometry::NormBox> parseBox(const YAML::Node& node) {
    if (!node || !node.IsSequence() || node.size() != 4) {
        return std::nullopt;
    }
    geometry::NormBox box;
    box.x1 = node[0].as<double>();
    box.y1 = node[1].as<double>();
    box.x2 = node[2].as<double>();
    box.y2 = node[3].as<double>();
    return box;
}

std::optional<geometry::Mask> parseMask(const YAML::Node& node) {
    if (!node || node.IsNull() || !node.IsSequence()) {
        return std::nullopt;
    }
    geometry::Mask mask;
    mask.reserve(node.size());
    for (const auto& pt : node) {
        if (!pt.IsSequence() || pt.size() < 2) {
            LOGW("DetectionFileProvider: malformed mask point, dropping mask");
            return std::nullopt;
        }
        mask.emplace_back(pt[0].as<double>(), pt[1].as<double>());
    }
    if (mask.empty()) return std::nullopt;
    return mask;
}

// {classes: [...], objects: [...]} with normalized boxes.
void parseObjectForm(const YAML::Node& root, DetectionResult& result) {
    if (root["classes"] && root["classes"].IsSequence()) {
        for (const auto& name : root["classes"]) {
            result.classes.push_back(name.as<std::string>());
        }
    }
    const YAML::Node& objects = root["objects"];
    if (!objects.IsSequence()) {
        LOGW("DetectionFileProvider: 'objects' is not a sequence");
        return;
    }
    for (size_t i = 0; i < objects.size(); ++i) {
        const YAML::Node& obj = objects[i];
        try {
            auto box = parseBox(obj["bbox"]);
            if (!box) {
                LOGW("DetectionFileProvider: object ", i, " has no valid bbox, skipping");
                continue;
            }
            Detection det;
            det.bbox = *box;
            det.class_id = obj["class_id"].as<int>(-1);
            det.class_name = obj["class_name"].as<std::string>("");
            det.confidence = obj["confidence"].as<float>(0.0f);
            det.mask = parseMask(obj["mask"]);
            result.detections.push_back(std::move(det));
        } catch (const YAML::Exception& e) {
            LOGW("DetectionFileProvider: object ", i, " is malformed: ", e.what());
        }
    }
}

// Detector summary {class, conf, bbox, masks} with absolute xyxy boxes.
bool parseSummaryForm(const YAML::Node& root, const cv::Size& image_size, DetectionResult& result) {
    const YAML::Node& boxes = root["bbox"];
    if (!boxes.IsSequence()) {
        LOGW("DetectionFileProvider: 'bbox' is not a sequence");
        return true;
    }
    const YAML::Node& names = root["class"];
    const YAML::Node& confs = root["conf"];
    const YAML::Node& masks = root["masks"];

    for (size_t i = 0; i < boxes.size(); ++i) {
        try {
            auto box = parseBox(boxes[i]);
            if (!box) {
                LOGW("DetectionFileProvider: bbox ", i, " is malformed, skipping");
                continue;
            }
            Detection det;
            det.bbox = *box;
            if (names.IsSequence() && i < names.size()) {
                det.class_name = names[i].as<std::string>("");
            }
            if (confs.IsSequence() && i < confs.size()) {
                det.confidence = confs[i].as<float>(0.0f);
            }
            if (masks.IsSequence() && i < masks.size()) {
                det.mask = parseMask(masks[i]);
            }
            result.detections.push_back(std::move(det));
        } catch (const YAML::Exception& e) {
            LOGW("DetectionFileProvider: detection ", i, " is malformed: ", e.what());
        }
    }
    return post::Postprocess::rescaleToNormalized(result.detections, image_size);
}

} // namespace

DetectionFileProvider::DetectionFileProvider(std::string directory)
    : directory_(std::move(directory)) {}

std::string DetectionFileProvider::findFileFor(const std::string& image_path) const {
    namespace fs = std::filesystem;
    const std::string stem = fs::path(image_path).stem().string();
    for (const char* ext : {".json", ".yaml", ".yml"}) {
        fs::path candidate = fs::path(directory_) / (stem + ext);
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return {};
}

std::optional<DetectionResult> DetectionFileProvider::detect(const std::string& image_path,
                                                             const cv::Size& image_size,
                                                             const DetectionPrompt& prompt) {
    (void)prompt;
    const std::string path = findFileFor(image_path);
    if (path.empty()) {
        LOGW("DetectionFileProvider: no detections for ", image_path, " in ", directory_);
        return std::nullopt;
    }
    return loadFile(path, image_size);
}

std::optional<DetectionResult> DetectionFileProvider::loadFile(const std::string& path,
                                                               const cv::Size& image_size) {
    try {
        const YAML::Node root = YAML::LoadFile(path);
        auto result = parse(root, image_size);
        if (result) {
            LOGD("Loaded ", result->detections.size(), " detections from ", path);
        }
        return result;
    } catch (const YAML::BadFile&) {
        LOGE("Detection file not readable: ", path);
    } catch (const YAML::Exception& e) {
        LOGE("Failed to parse detection file '", path, "': ", e.what());
    }
    return std::nullopt;
}

std::optional<DetectionResult> DetectionFileProvider::parse(const YAML::Node& root,
                                                            const cv::Size& image_size) {
    if (!root.IsMap()) {
        LOGE("DetectionFileProvider: top-level node is not a map");
        return std::nullopt;
    }
    DetectionResult result;
    if (root["objects"]) {
        parseObjectForm(root, result);
        return result;
    }
    if (root["bbox"]) {
        if (!parseSummaryForm(root, image_size, result)) {
            return std::nullopt;
        }
        return result;
    }
    // A map without either key is an empty result, not a failure.
    return result;
}

} // namespace annokit::infer
