#include "annokit/render/OverlayRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <opencv2/imgproc.hpp>

#include "annokit/common/log.hpp"

namespace annokit::render {

using geometry::CoordTransform;

namespace {

cv::Point toViewPixel(const cv::Point2d& p, const interaction::ViewState& view) {
    const cv::Point2d v = CoordTransform::imageToView(p, view.pan, view.scale);
    return cv::Point(static_cast<int>(std::lround(v.x)), static_cast<int>(std::lround(v.y)));
}

void drawLabel(cv::Mat& canvas, const std::string& label, cv::Point anchor, const cv::Scalar& color) {
    int baseline = 0;
    const cv::Size text_size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
    const cv::Point label_pos(anchor.x, anchor.y - 5);
    cv::rectangle(canvas,
                  cv::Rect(label_pos.x, label_pos.y - text_size.height - baseline,
                           text_size.width, text_size.height + baseline),
                  color, -1);
    cv::putText(canvas, label, label_pos, cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
}

} // namespace

std::vector<cv::Scalar> OverlayRenderer::classColors(std::size_t count) {
    std::vector<cv::Scalar> colors;
    colors.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double hue = std::fmod(static_cast<double>(i) * 137.5, 360.0);
        // OpenCV 8-bit hue range is [0,180).
        cv::Mat hsv(1, 1, CV_8UC3, cv::Scalar(hue / 2.0, 0.6 * 255.0, 0.85 * 255.0));
        cv::Mat bgr;
        cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
        const cv::Vec3b px = bgr.at<cv::Vec3b>(0, 0);
        colors.emplace_back(px[0], px[1], px[2]);
    }
    return colors;
}

cv::Mat OverlayRenderer::render(const cv::Mat& image, const interaction::AnnotationSession& session) {
    const auto& view = session.view();
    if (image.empty() || !view.valid()) {
        LOGW("OverlayRenderer: nothing to render");
        return {};
    }

    if (std::lround(image.cols * view.scale) <= 0 || std::lround(image.rows * view.scale) <= 0) {
        LOGW("OverlayRenderer: scale ", view.scale, " leaves nothing of a ", image.cols, "x",
             image.rows, " image");
        return {};
    }

    cv::Mat scaled;
    if (view.scale != 1.0) {
        cv::resize(image, scaled, cv::Size(), view.scale, view.scale, cv::INTER_LINEAR);
    } else {
        scaled = image;
    }

    const int out_w = scaled.cols + static_cast<int>(std::max(0.0, view.pan.x));
    const int out_h = scaled.rows + static_cast<int>(std::max(0.0, view.pan.y));
    cv::Mat canvas = cv::Mat::zeros(out_h, out_w, scaled.type());
    const cv::Rect dst(static_cast<int>(view.pan.x), static_cast<int>(view.pan.y), scaled.cols, scaled.rows);
    const cv::Rect visible = dst & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (visible.area() > 0) {
        const cv::Rect src(visible.x - dst.x, visible.y - dst.y, visible.width, visible.height);
        scaled(src).copyTo(canvas(visible));
    }

    const auto* objects = session.objectSet();
    if (objects) {
        const auto colors = classColors(std::max<std::size_t>(objects->classNames().size(), 1));
        const auto selected = objects->selectedIndex();
        const cv::Size size = session.imageSize();

        for (std::size_t i = 0; i < objects->size(); ++i) {
            const auto& obj = *objects->at(i);
            if (!obj.visible) continue;

            const cv::Scalar color = colors[static_cast<std::size_t>(obj.class_id) % colors.size()];
            const int thickness = selected == i ? 3 : 2;
            const cv::Rect2d abs = CoordTransform::toAbsolute(obj.bbox, size.width, size.height);
            const cv::Point tl = toViewPixel(abs.tl(), view);
            const cv::Point br = toViewPixel(abs.br(), view);
            cv::rectangle(canvas, tl, br, color, thickness);

            if (obj.mask && obj.mask->size() >= 3) {
                std::vector<cv::Point> poly;
                poly.reserve(obj.mask->size());
                for (const auto& pt : *obj.mask) {
                    poly.push_back(toViewPixel(pt, view));
                }
                cv::polylines(canvas, poly, true, color, 2);
            }

            std::string name = objects->className(obj.class_id);
            if (name.empty()) name = "class " + std::to_string(obj.class_id);
            const int pct = static_cast<int>(std::lround(obj.confidence * 100.0f));
            drawLabel(canvas, name + " " + std::to_string(pct) + "%", tl, color);
        }
    }

    if (auto draft = session.draftBox()) {
        cv::rectangle(canvas, toViewPixel(draft->tl(), view), toViewPixel(draft->br(), view),
                      cv::Scalar(0, 200, 255), 1);
    }
    return canvas;
}

} // namespace annokit::render
