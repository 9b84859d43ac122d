#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

#include "annokit/store/AnnotatedObject.hpp"

namespace annokit::interaction {

enum class EditMode {
    SELECT,
    DRAW,
    PAN
};

// What the pointer landed on, as resolved by the rendering surface.
enum class PointerTarget {
    CANVAS,
    OBJECT,          // body of object_index
    RESIZE_HANDLE    // resize handle of the selected object_index
};

struct PointerEvent {
    cv::Point2d position;                        // view space
    PointerTarget target = PointerTarget::CANVAS;
    std::size_t object_index = 0;
};

struct ViewState {
    double scale = 1.0;                 // > 0
    cv::Point2d pan{0.0, 0.0};          // device pixels
    cv::Size image_size{0, 0};
    cv::Size container{0, 0};

    bool valid() const { return scale > 0.0 && image_size.width > 0 && image_size.height > 0; }
};

enum class GestureKind {
    NONE,
    DRAW_BOX,
    MOVE_OBJECT,
    RESIZE_OBJECT,
    PAN
};

// At most one gesture is in progress per session.
struct Gesture {
    GestureKind kind = GestureKind::NONE;
    cv::Point2d start_view;
    cv::Point2d last_view;
    cv::Point2d start_image;
    cv::Rect2d box;                 // DRAW_BOX: candidate box in image space
    store::ObjectId object_id = 0;  // MOVE_OBJECT / RESIZE_OBJECT

    bool active() const { return kind != GestureKind::NONE; }
};

struct SessionConfig {
    double min_box_px = 5.0;       // drawn boxes must exceed this on both sides
    double min_resize_px = 5.0;    // resized boxes must keep at least this on both sides
    cv::Size container{0, 0};      // viewport used for the fit-to-view scale
};

const char* editModeName(EditMode mode);
std::optional<EditMode> editModeFromString(const std::string& name);

} // namespace annokit::interaction
