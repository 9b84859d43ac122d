#include "annokit/interaction/ModeHandlers.hpp"

#include "annokit/common/StringUtils.hpp"
#include "annokit/common/log.hpp"
#include "annokit/geometry/CoordTransform.hpp"
#include "annokit/interaction/AnnotationSession.hpp"

namespace annokit::interaction {

using geometry::CoordTransform;

const char* editModeName(EditMode mode) {
    switch (mode) {
        case EditMode::SELECT: return "select";
        case EditMode::DRAW: return "draw";
        case EditMode::PAN: return "pan";
    }
    return "select";
}

std::optional<EditMode> editModeFromString(const std::string& name) {
    const std::string lower = common::toLowerCopy(name);
    if (lower == "select") return EditMode::SELECT;
    if (lower == "draw") return EditMode::DRAW;
    if (lower == "pan") return EditMode::PAN;
    return std::nullopt;
}

// ============================================================================
// Select
// ============================================================================

void SelectModeHandler::onPointerDown(AnnotationSession& session, const PointerEvent& event) {
    auto* objects = session.objectSet();

    if (event.target == PointerTarget::CANVAS) {
        session.endGesture();
        if (objects) objects->clearSelection();
        return;
    }
    if (!objects) {
        return;
    }

    if (event.target == PointerTarget::RESIZE_HANDLE) {
        // Handles only exist on the selected object.
        if (objects->selectedIndex() != event.object_index) {
            LOGD("SelectModeHandler: handle press on unselected object ", event.object_index);
            return;
        }
    } else if (!objects->select(event.object_index)) {
        LOGD("SelectModeHandler: object ", event.object_index, " not selectable");
        return;
    }

    const auto* obj = objects->at(event.object_index);
    session.beginGesture(event.target == PointerTarget::RESIZE_HANDLE ? GestureKind::RESIZE_OBJECT
                                                                      : GestureKind::MOVE_OBJECT,
                         event);
    session.gesture_.object_id = obj->id;
}

void SelectModeHandler::onPointerMove(AnnotationSession& session, const PointerEvent& event) {
    auto& gesture = session.gesture_;
    if (gesture.kind == GestureKind::MOVE_OBJECT || gesture.kind == GestureKind::RESIZE_OBJECT) {
        gesture.last_view = event.position;
    }
}

void SelectModeHandler::onPointerUp(AnnotationSession& session, const PointerEvent& event) {
    const Gesture gesture = session.gesture_;
    session.endGesture();

    if (gesture.kind == GestureKind::MOVE_OBJECT) {
        const cv::Point2d end = session.toImage(event.position);
        const cv::Point2d delta = end - gesture.start_image;
        if (delta.x == 0.0 && delta.y == 0.0) {
            return;  // plain click
        }
        session.applyTranslate(gesture.object_id, delta.x, delta.y);
        return;
    }

    if (gesture.kind == GestureKind::RESIZE_OBJECT) {
        const auto* objects = session.objectSet();
        if (!objects) return;
        const auto index = objects->indexOf(gesture.object_id);
        if (!index) return;

        const cv::Size size = session.imageSize();
        const cv::Rect2d abs =
            CoordTransform::toAbsolute(objects->at(*index)->bbox, size.width, size.height);
        if (abs.width <= 0.0 || abs.height <= 0.0) {
            LOGD("SelectModeHandler: cannot resize a zero-size box");
            return;
        }
        // The handle drags the bottom-right corner; the top-left stays anchored.
        const cv::Point2d end = session.toImage(event.position);
        const cv::Point2d start = gesture.start_image;
        const double new_w = abs.width + (end.x - start.x);
        const double new_h = abs.height + (end.y - start.y);
        session.applyResize(gesture.object_id, new_w / abs.width, new_h / abs.height);
    }
}

// ============================================================================
// Draw
// ============================================================================

void DrawModeHandler::onPointerDown(AnnotationSession& session, const PointerEvent& event) {
    if (event.target != PointerTarget::CANVAS) {
        return;
    }
    if (auto* objects = session.objectSet()) {
        objects->clearSelection();
    }
    session.beginGesture(GestureKind::DRAW_BOX, event);
    session.gesture_.box = cv::Rect2d(session.gesture_.start_image, cv::Size2d(0.0, 0.0));
}

void DrawModeHandler::onPointerMove(AnnotationSession& session, const PointerEvent& event) {
    auto& gesture = session.gesture_;
    if (gesture.kind != GestureKind::DRAW_BOX) {
        return;
    }
    gesture.last_view = event.position;
    gesture.box = CoordTransform::rectFromCorners(gesture.start_image, session.toImage(event.position));
}

void DrawModeHandler::onPointerUp(AnnotationSession& session, const PointerEvent& event) {
    if (session.gesture_.kind != GestureKind::DRAW_BOX) {
        return;
    }
    const cv::Rect2d box =
        CoordTransform::rectFromCorners(session.gesture_.start_image, session.toImage(event.position));
    session.endGesture();
    session.commitDraftBox(box);
}

// ============================================================================
// Pan
// ============================================================================

void PanModeHandler::onPointerDown(AnnotationSession& session, const PointerEvent& event) {
    if (event.target != PointerTarget::CANVAS) {
        return;
    }
    session.beginGesture(GestureKind::PAN, event);
}

void PanModeHandler::onPointerMove(AnnotationSession& session, const PointerEvent& event) {
    auto& gesture = session.gesture_;
    if (gesture.kind != GestureKind::PAN) {
        return;
    }
    session.view_.pan += event.position - gesture.last_view;
    gesture.last_view = event.position;
}

void PanModeHandler::onPointerUp(AnnotationSession& session, const PointerEvent& event) {
    if (session.gesture_.kind != GestureKind::PAN) {
        return;
    }
    onPointerMove(session, event);
    session.endGesture();
}

ModeHandlerPtr createModeHandler(EditMode mode) {
    switch (mode) {
        case EditMode::DRAW: return std::make_unique<DrawModeHandler>();
        case EditMode::PAN: return std::make_unique<PanModeHandler>();
        case EditMode::SELECT: break;
    }
    return std::make_unique<SelectModeHandler>();
}

} // namespace annokit::interaction
