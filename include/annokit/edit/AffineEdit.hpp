#pragma once

#include <optional>

#include "annokit/geometry/CoordTransform.hpp"
#include "annokit/store/AnnotatedObject.hpp"

namespace annokit::edit {

// Geometry produced by one edit. Nothing is written back to the store here.
struct EditResult {
    geometry::NormBox bbox;
    std::optional<geometry::Mask> mask;
};

/**
 * @brief Move / resize a box and its mask as one unit
 *
 * The box is edited in absolute space and re-normalized against the image
 * size; mask points are already absolute and are edited directly. Degenerate
 * scale factors are not rejected here, the interaction layer guards them.
 */
class AffineEdit {
public:
    /**
     * @brief Shift box and mask by (dx, dy) pixels
     */
    static EditResult translate(const store::AnnotatedObject& obj, double dx, double dy,
                                int width, int height);

    /**
     * @brief Scale box and mask around the box's top-left corner
     *
     * newPoint = anchor + (oldPoint - anchor) * (scale_x, scale_y)
     */
    static EditResult scale(const store::AnnotatedObject& obj, double scale_x, double scale_y,
                            int width, int height);
};

} // namespace annokit::edit
