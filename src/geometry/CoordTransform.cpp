#include "annokit/geometry/CoordTransform.hpp"

#include <algorithm>
#include <cmath>

#include "annokit/common/log.hpp"

namespace annokit::geometry {

cv::Rect2d CoordTransform::toAbsolute(const NormBox& box, int width, int height) {
    if (width <= 0 || height <= 0) {
        LOGD("CoordTransform::toAbsolute: invalid image size ", width, "x", height);
        return {};
    }
    const double w = static_cast<double>(width);
    const double h = static_cast<double>(height);
    return cv::Rect2d(box.x1 * w, box.y1 * h, (box.x2 - box.x1) * w, (box.y2 - box.y1) * h);
}

NormBox CoordTransform::toNormalized(const cv::Rect2d& rect, int width, int height) {
    if (width <= 0 || height <= 0) {
        LOGD("CoordTransform::toNormalized: invalid image size ", width, "x", height);
        return {};
    }
    const double w = static_cast<double>(width);
    const double h = static_cast<double>(height);
    NormBox box;
    box.x1 = rect.x / w;
    box.y1 = rect.y / h;
    box.x2 = (rect.x + rect.width) / w;
    box.y2 = (rect.y + rect.height) / h;
    return box;
}

std::vector<double> CoordTransform::localizeMask(const Mask& mask, double origin_x, double origin_y) {
    std::vector<double> local;
    local.reserve(mask.size() * 2);
    for (const auto& pt : mask) {
        local.push_back(pt.x - origin_x);
        local.push_back(pt.y - origin_y);
    }
    return local;
}

Mask CoordTransform::relocalizeMask(const std::vector<double>& local, double origin_x, double origin_y) {
    Mask mask;
    mask.reserve(local.size() / 2);
    for (size_t i = 0; i + 1 < local.size(); i += 2) {
        mask.emplace_back(local[i] + origin_x, local[i + 1] + origin_y);
    }
    return mask;
}

cv::Point2d CoordTransform::viewToImage(const cv::Point2d& pointer, const cv::Point2d& pan, double scale) {
    if (!(scale > 0.0)) {
        LOGW("CoordTransform::viewToImage: invalid scale ", scale, ", ignoring zoom");
        return pointer - pan;
    }
    return cv::Point2d((pointer.x - pan.x) / scale, (pointer.y - pan.y) / scale);
}

cv::Point2d CoordTransform::imageToView(const cv::Point2d& point, const cv::Point2d& pan, double scale) {
    if (!(scale > 0.0)) {
        return point + pan;
    }
    return cv::Point2d(point.x * scale + pan.x, point.y * scale + pan.y);
}

double CoordTransform::fitScale(const cv::Size& image, const cv::Size& container) {
    if (!isValidSize(image) || !isValidSize(container)) {
        return 1.0;
    }
    const double sx = static_cast<double>(container.width) / image.width;
    const double sy = static_cast<double>(container.height) / image.height;
    return std::min({sx, sy, 1.0});
}

cv::Rect2d CoordTransform::rectFromCorners(const cv::Point2d& a, const cv::Point2d& b) {
    return cv::Rect2d(std::min(a.x, b.x), std::min(a.y, b.y),
                      std::fabs(b.x - a.x), std::fabs(b.y - a.y));
}

} // namespace annokit::geometry
