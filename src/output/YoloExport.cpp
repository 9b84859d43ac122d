#include "annokit/output/YoloExport.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "annokit/common/log.hpp"

namespace annokit::output {

namespace {

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

bool isFiniteRect(const cv::Rect2d& r) {
    return std::isfinite(r.x) && std::isfinite(r.y) && std::isfinite(r.width) && std::isfinite(r.height);
}

} // namespace

const std::string& ExportRecord::effectiveName() const {
    if (!user_label.empty()) return user_label;
    if (!category_name.empty()) return category_name;
    return original_class;
}

std::string YoloExport::convert(const std::vector<ExportRecord>& records,
                                int image_width, int image_height,
                                const ClassMap& class_name_to_id) {
    if (records.empty() || image_width <= 0 || image_height <= 0) {
        return "";
    }

    const double w = static_cast<double>(image_width);
    const double h = static_cast<double>(image_height);

    std::string out;
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& rec = records[i];
        const std::string& name = rec.effectiveName();
        auto it = class_name_to_id.find(name);
        if (name.empty() || it == class_name_to_id.end()) {
            LOGW("YoloExport: skipping record ", i, " with missing or unknown class '", name, "'");
            continue;
        }
        if (!isFiniteRect(rec.bbox)) {
            LOGW("YoloExport: skipping record ", i, " with malformed bbox");
            continue;
        }

        const double xc = rec.bbox.x + rec.bbox.width / 2.0;
        const double yc = rec.bbox.y + rec.bbox.height / 2.0;

        if (!out.empty()) out += '\n';
        out += formatLine(it->second,
                          clamp01(xc / w), clamp01(yc / h),
                          clamp01(rec.bbox.width / w), clamp01(rec.bbox.height / h));
    }
    return out;
}

std::vector<ExportRecord> YoloExport::recordsFromObjectSet(const store::ObjectSet& objects,
                                                           const cv::Size& image_size) {
    std::vector<ExportRecord> records;
    if (!geometry::isValidSize(image_size)) {
        return records;
    }
    records.reserve(objects.size());
    for (const auto& obj : objects.objects()) {
        ExportRecord rec;
        rec.bbox = geometry::CoordTransform::toAbsolute(obj.bbox, image_size.width, image_size.height);
        rec.category_name = objects.className(obj.class_id);
        records.push_back(std::move(rec));
    }
    return records;
}

std::string YoloExport::exportObjectSet(const store::ObjectSet& objects,
                                        const cv::Size& image_size,
                                        const ClassMap& class_name_to_id) {
    return convert(recordsFromObjectSet(objects, image_size),
                   image_size.width, image_size.height, class_name_to_id);
}

ClassMap YoloExport::buildClassMap(const std::vector<std::string>& class_names) {
    ClassMap map;
    for (size_t i = 0; i < class_names.size(); ++i) {
        map.emplace(class_names[i], static_cast<int>(i));
    }
    return map;
}

std::string YoloExport::formatLine(int class_id, double xc, double yc, double w, double h) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "%d %.6f %.6f %.6f %.6f", class_id, xc, yc, w, h);
    return buf;
}

} // namespace annokit::output
