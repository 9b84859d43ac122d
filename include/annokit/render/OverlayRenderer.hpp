#pragma once

#include <vector>
#include <opencv2/core.hpp>

#include "annokit/interaction/AnnotationSession.hpp"

namespace annokit::render {

/**
 * @brief Draws a session's visible objects for inspection
 *
 * The image is scaled by the view scale and shifted by the pan offset, so the
 * output matches what the pointer coordinates refer to. Hidden objects are
 * skipped; the selected one is drawn with a thicker stroke; an in-progress
 * draw gesture is drawn as a thin box.
 */
class OverlayRenderer {
public:
    static cv::Mat render(const cv::Mat& image, const interaction::AnnotationSession& session);

    // One BGR color per class, hues spaced by the golden angle.
    static std::vector<cv::Scalar> classColors(std::size_t count);
};

} // namespace annokit::render
