#include "annokit/post/Postprocess.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

#include "annokit/common/StringUtils.hpp"
#include "annokit/common/log.hpp"

namespace annokit::post {

namespace {

bool isFiniteBox(const geometry::NormBox& b) {
    return std::isfinite(b.x1) && std::isfinite(b.y1) && std::isfinite(b.x2) && std::isfinite(b.y2);
}

int resolveClassId(const infer::Detection& det, std::vector<std::string>& classes) {
    if (!det.class_name.empty()) {
        auto it = std::find(classes.begin(), classes.end(), det.class_name);
        if (it != classes.end()) {
            return static_cast<int>(it - classes.begin());
        }
        classes.push_back(det.class_name);
        return static_cast<int>(classes.size() - 1);
    }
    if (det.class_id >= 0 && det.class_id < static_cast<int>(classes.size())) {
        return det.class_id;
    }
    // Vocabulary-less results: accept the raw id as is.
    if (classes.empty() && det.class_id >= 0) {
        return det.class_id;
    }
    return -1;
}

} // namespace

bool Postprocess::rescaleToNormalized(std::vector<infer::Detection>& detections,
                                      const cv::Size& image_size) {
    if (!geometry::isValidSize(image_size)) {
        LOGE("Postprocess::rescaleToNormalized: invalid image size ",
             image_size.width, "x", image_size.height);
        return false;
    }
    const double w = static_cast<double>(image_size.width);
    const double h = static_cast<double>(image_size.height);
    for (auto& det : detections) {
        det.bbox.x1 /= w;
        det.bbox.y1 /= h;
        det.bbox.x2 /= w;
        det.bbox.y2 /= h;
    }
    return true;
}

std::vector<store::AnnotatedObject> Postprocess::toObjects(const infer::DetectionResult& result,
                                                           std::vector<std::string>& classes) {
    std::vector<store::AnnotatedObject> objects;
    objects.reserve(result.detections.size());

    for (size_t i = 0; i < result.detections.size(); ++i) {
        const auto& det = result.detections[i];
        if (!isFiniteBox(det.bbox)) {
            LOGW("Postprocess::toObjects: skipping detection ", i, " with non-finite bbox");
            continue;
        }
        const int class_id = resolveClassId(det, classes);
        if (class_id < 0) {
            LOGW("Postprocess::toObjects: skipping detection ", i, " with unknown class id ",
                 det.class_id);
            continue;
        }

        store::AnnotatedObject obj;
        obj.class_id = class_id;
        obj.bbox = orderCorners(det.bbox);
        obj.mask = det.mask;
        obj.confidence = std::isfinite(det.confidence)
                             ? std::clamp(det.confidence, 0.0f, 1.0f)
                             : 0.0f;
        obj.visible = true;
        objects.push_back(std::move(obj));
    }
    return objects;
}

geometry::NormBox Postprocess::orderCorners(const geometry::NormBox& box) {
    geometry::NormBox out;
    out.x1 = std::min(box.x1, box.x2);
    out.x2 = std::max(box.x1, box.x2);
    out.y1 = std::min(box.y1, box.y2);
    out.y2 = std::max(box.y1, box.y2);
    return out;
}

std::vector<std::string> Postprocess::loadClassNames(const std::string& path) {
    std::vector<std::string> class_names;
    std::ifstream file(path);

    if (!file.is_open()) {
        LOGE("Failed to open class names file: ", path);
        return class_names;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = common::trimCopy(line);
        if (!line.empty()) class_names.push_back(line);
    }

    LOGI("Loaded ", class_names.size(), " class names from ", path);
    return class_names;
}

} // namespace annokit::post
