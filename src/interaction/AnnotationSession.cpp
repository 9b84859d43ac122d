#include "annokit/interaction/AnnotationSession.hpp"

#include <cmath>
#include <utility>

#include "annokit/common/log.hpp"
#include "annokit/edit/AffineEdit.hpp"

namespace annokit::interaction {

using geometry::CoordTransform;

AnnotationSession::AnnotationSession(SessionConfig config)
    : config_(config), handler_(createModeHandler(EditMode::SELECT)) {
    view_.container = config_.container;
}

AnnotationSession::~AnnotationSession() = default;
AnnotationSession::AnnotationSession(AnnotationSession&&) = default;
AnnotationSession& AnnotationSession::operator=(AnnotationSession&&) = default;

bool AnnotationSession::setImageSize(const cv::Size& size) {
    if (!geometry::isValidSize(size)) {
        LOGW("AnnotationSession: ignoring invalid image size ", size.width, "x", size.height);
        return false;
    }
    view_.image_size = size;
    view_.scale = CoordTransform::fitScale(size, view_.container);
    return true;
}

store::ObjectSet* AnnotationSession::objectSet() {
    return objects_ ? &*objects_ : nullptr;
}

const store::ObjectSet* AnnotationSession::objectSet() const {
    return objects_ ? &*objects_ : nullptr;
}

store::ObjectSet& AnnotationSession::ensureObjectSet() {
    if (!objects_) {
        objects_.emplace(default_class_names_);
    }
    return *objects_;
}

void AnnotationSession::setDefaultClassNames(std::vector<std::string> class_names) {
    default_class_names_ = std::move(class_names);
    if (objects_ && objects_->classNames().empty()) {
        objects_->setClassNames(default_class_names_);
    }
}

void AnnotationSession::commitDetections(std::vector<store::AnnotatedObject> objects,
                                         std::vector<std::string> class_names) {
    endGesture();
    auto& set = ensureObjectSet();
    set.setClassNames(std::move(class_names));
    set.replaceAll(std::move(objects));
    status_message_.clear();
    setMode(EditMode::SELECT);
    LOGD("AnnotationSession: committed ", set.size(), " objects");
}

void AnnotationSession::failDetections(const std::string& message) {
    endGesture();
    ensureObjectSet().clear();
    status_message_ = message;
    LOGW("AnnotationSession: detection failed: ", message);
}

EditMode AnnotationSession::mode() const {
    return handler_->mode();
}

void AnnotationSession::setMode(EditMode mode) {
    endGesture();
    if (mode == EditMode::PAN && objects_) {
        objects_->clearSelection();
    }
    if (handler_->mode() != mode) {
        handler_ = createModeHandler(mode);
        LOGD("AnnotationSession: mode -> ", editModeName(mode));
    }
}

void AnnotationSession::setWorkflow(infer::Workflow workflow) {
    workflow_ = workflow;
    setMode(workflow == infer::Workflow::IMAGE_PROMPT ? EditMode::DRAW : EditMode::SELECT);
}

void AnnotationSession::pointerDown(const PointerEvent& event) {
    if (!isReady()) return;
    handler_->onPointerDown(*this, event);
}

void AnnotationSession::pointerMove(const PointerEvent& event) {
    if (!isReady()) return;
    handler_->onPointerMove(*this, event);
}

void AnnotationSession::pointerUp(const PointerEvent& event) {
    if (!isReady()) return;
    handler_->onPointerUp(*this, event);
}

bool AnnotationSession::deleteSelected() {
    if (!objects_) return false;
    const auto selected = objects_->selectedIndex();
    if (!selected) return false;
    endGesture();
    const bool removed = objects_->remove(*selected);
    objects_->clearSelection();
    return removed;
}

void AnnotationSession::cancel() {
    endGesture();
    if (objects_) objects_->clearSelection();
}

bool AnnotationSession::selectObject(std::size_t index) {
    if (!objects_ || mode() != EditMode::SELECT) return false;
    return objects_->select(index);
}

void AnnotationSession::clearSelection() {
    if (objects_) objects_->clearSelection();
}

std::optional<std::size_t> AnnotationSession::selectedIndex() const {
    return objects_ ? objects_->selectedIndex() : std::nullopt;
}

bool AnnotationSession::toggleVisibility(std::size_t index) {
    return objects_ && objects_->toggleVisibility(index);
}

bool AnnotationSession::setObjectClass(std::size_t index, int class_id) {
    return objects_ && objects_->setClass(index, class_id);
}

bool AnnotationSession::translateObject(std::size_t index, double dx, double dy) {
    if (!objects_ || mode() != EditMode::SELECT) return false;
    const auto* obj = objects_->at(index);
    if (!obj) return false;
    return applyTranslate(obj->id, dx, dy);
}

bool AnnotationSession::resizeObject(std::size_t index, double scale_x, double scale_y) {
    if (!objects_ || mode() != EditMode::SELECT) return false;
    const auto* obj = objects_->at(index);
    if (!obj) return false;
    return applyResize(obj->id, scale_x, scale_y);
}

bool AnnotationSession::setScale(double scale) {
    if (!(scale > 0.0) || !std::isfinite(scale)) {
        LOGD("AnnotationSession: ignoring scale ", scale);
        return false;
    }
    view_.scale = scale;
    return true;
}

void AnnotationSession::setContainer(const cv::Size& container) {
    view_.container = container;
    if (geometry::isValidSize(view_.image_size)) {
        view_.scale = CoordTransform::fitScale(view_.image_size, container);
    }
}

void AnnotationSession::resetView() {
    view_.pan = cv::Point2d(0.0, 0.0);
    view_.scale = CoordTransform::fitScale(view_.image_size, view_.container);
}

void AnnotationSession::activate() {
    endGesture();
    clearSelection();
    resetView();
    const bool has_objects = objects_ && !objects_->empty();
    if (!has_objects && workflow_ == infer::Workflow::IMAGE_PROMPT) {
        setMode(EditMode::DRAW);
    } else {
        setMode(EditMode::SELECT);
    }
}

void AnnotationSession::deactivate() {
    endGesture();
}

std::optional<cv::Rect2d> AnnotationSession::draftBox() const {
    if (gesture_.kind != GestureKind::DRAW_BOX) return std::nullopt;
    return gesture_.box;
}

void AnnotationSession::clearVisualPrompts() {
    visual_prompts_.bboxes.clear();
    visual_prompts_.cls.clear();
}

cv::Point2d AnnotationSession::toImage(const cv::Point2d& view_point) const {
    return CoordTransform::viewToImage(view_point, view_.pan, view_.scale);
}

void AnnotationSession::beginGesture(GestureKind kind, const PointerEvent& event) {
    // A new press supersedes whatever was left unfinished.
    endGesture();
    gesture_.kind = kind;
    gesture_.start_view = event.position;
    gesture_.last_view = event.position;
    gesture_.start_image = toImage(event.position);
}

void AnnotationSession::endGesture() {
    gesture_ = Gesture{};
}

bool AnnotationSession::commitDraftBox(const cv::Rect2d& box) {
    if (!(box.width > config_.min_box_px && box.height > config_.min_box_px)) {
        LOGD("AnnotationSession: discarding ", box.width, "x", box.height, " box below ",
             config_.min_box_px, "px");
        return false;
    }

    const cv::Size size = view_.image_size;
    const geometry::NormBox nbox = CoordTransform::toNormalized(box, size.width, size.height);

    if (workflow_ == infer::Workflow::IMAGE_PROMPT) {
        visual_prompts_.bboxes.push_back(nbox);
        visual_prompts_.cls.push_back(0);
        return true;
    }
    return ensureObjectSet().add(nbox, 0).has_value();
}

bool AnnotationSession::applyTranslate(store::ObjectId id, double dx, double dy) {
    if (!objects_ || !isReady() || !std::isfinite(dx) || !std::isfinite(dy)) return false;
    const auto index = objects_->indexOf(id);
    if (!index) {
        LOGD("AnnotationSession: translate target ", id, " no longer exists");
        return false;
    }
    const cv::Size size = view_.image_size;
    auto result = edit::AffineEdit::translate(*objects_->at(*index), dx, dy, size.width, size.height);
    return objects_->update(*index, result.bbox, std::move(result.mask));
}

bool AnnotationSession::applyResize(store::ObjectId id, double scale_x, double scale_y) {
    if (!objects_ || !isReady()) return false;
    if (!(scale_x > 0.0) || !(scale_y > 0.0) || !std::isfinite(scale_x) || !std::isfinite(scale_y)) {
        LOGD("AnnotationSession: rejecting scale ", scale_x, ", ", scale_y);
        return false;
    }
    const auto index = objects_->indexOf(id);
    if (!index) {
        LOGD("AnnotationSession: resize target ", id, " no longer exists");
        return false;
    }

    const cv::Size size = view_.image_size;
    const auto& obj = *objects_->at(*index);
    const cv::Rect2d abs = CoordTransform::toAbsolute(obj.bbox, size.width, size.height);
    if (abs.width * scale_x < config_.min_resize_px || abs.height * scale_y < config_.min_resize_px) {
        LOGD("AnnotationSession: rejecting resize below ", config_.min_resize_px, "px");
        return false;
    }

    auto result = edit::AffineEdit::scale(obj, scale_x, scale_y, size.width, size.height);
    return objects_->update(*index, result.bbox, std::move(result.mask));
}

} // namespace annokit::interaction
