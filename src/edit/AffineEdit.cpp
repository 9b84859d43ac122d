#include "annokit/edit/AffineEdit.hpp"

#include "annokit/common/log.hpp"

namespace annokit::edit {

using geometry::CoordTransform;

EditResult AffineEdit::translate(const store::AnnotatedObject& obj, double dx, double dy,
                                 int width, int height) {
    EditResult result{obj.bbox, obj.mask};
    if (width <= 0 || height <= 0) {
        LOGW("AffineEdit::translate: invalid image size ", width, "x", height);
        return result;
    }

    cv::Rect2d abs = CoordTransform::toAbsolute(obj.bbox, width, height);
    abs.x += dx;
    abs.y += dy;
    result.bbox = CoordTransform::toNormalized(abs, width, height);

    if (result.mask) {
        const cv::Point2d offset(dx, dy);
        for (auto& pt : *result.mask) {
            pt += offset;
        }
    }
    return result;
}

EditResult AffineEdit::scale(const store::AnnotatedObject& obj, double scale_x, double scale_y,
                             int width, int height) {
    EditResult result{obj.bbox, obj.mask};
    if (width <= 0 || height <= 0) {
        LOGW("AffineEdit::scale: invalid image size ", width, "x", height);
        return result;
    }

    cv::Rect2d abs = CoordTransform::toAbsolute(obj.bbox, width, height);
    const cv::Point2d anchor(abs.x, abs.y);
    abs.width *= scale_x;
    abs.height *= scale_y;
    result.bbox = CoordTransform::toNormalized(abs, width, height);

    if (result.mask) {
        for (auto& pt : *result.mask) {
            pt.x = anchor.x + (pt.x - anchor.x) * scale_x;
            pt.y = anchor.y + (pt.y - anchor.y) * scale_y;
        }
    }
    return result;
}

} // namespace annokit::edit
