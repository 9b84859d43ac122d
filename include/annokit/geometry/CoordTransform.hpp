#pragma once

#include <vector>
#include <opencv2/core.hpp>

namespace annokit::geometry {

// Box in normalized [0,1] space: corners relative to image width/height.
struct NormBox {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;
};

// Polygon in absolute pixel space.
using Mask = std::vector<cv::Point2d>;

inline bool isValidSize(const cv::Size& size) {
    return size.width > 0 && size.height > 0;
}

/**
 * @brief Stateless conversions between normalized, absolute-pixel and view space
 *
 * View space is what the pointer reports: image space scaled by the current
 * zoom and shifted by the pan offset.
 */
class CoordTransform {
public:
    /**
     * @brief Normalized corners to absolute {x, y, width, height}
     *
     * Zero-size boxes are allowed here. Non-positive image dimensions
     * return an empty rect.
     */
    static cv::Rect2d toAbsolute(const NormBox& box, int width, int height);

    /**
     * @brief Absolute {x, y, width, height} back to normalized corners
     */
    static NormBox toNormalized(const cv::Rect2d& rect, int width, int height);

    /**
     * @brief Subtract the box origin from each mask point
     *
     * Returns a flat [x0, y0, x1, y1, ...] sequence in the box's local frame.
     */
    static std::vector<double> localizeMask(const Mask& mask, double origin_x, double origin_y);

    /**
     * @brief Re-add the box origin to a flat local sequence
     *
     * Exact inverse of localizeMask. A trailing odd coordinate is dropped.
     */
    static Mask relocalizeMask(const std::vector<double>& local, double origin_x, double origin_y);

    static cv::Point2d viewToImage(const cv::Point2d& pointer, const cv::Point2d& pan, double scale);
    static cv::Point2d imageToView(const cv::Point2d& point, const cv::Point2d& pan, double scale);

    /**
     * @brief Scale that fits the image inside the container without upscaling
     *
     * min(container.w / image.w, container.h / image.h, 1). Returns 1 when
     * either size is unknown.
     */
    static double fitScale(const cv::Size& image, const cv::Size& container);

    // Rect spanned by two corners, in any order.
    static cv::Rect2d rectFromCorners(const cv::Point2d& a, const cv::Point2d& b);
};

} // namespace annokit::geometry
