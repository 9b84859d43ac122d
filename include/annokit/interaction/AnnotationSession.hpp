#pragma once

#include <optional>
#include <string>
#include <vector>

#include "annokit/infer/IDetectionProvider.hpp"
#include "annokit/interaction/InteractionTypes.hpp"
#include "annokit/interaction/ModeHandlers.hpp"
#include "annokit/store/ObjectSet.hpp"

namespace annokit::interaction {

/**
 * @brief Editing state of one image
 *
 * Owns the image's object set, view (zoom/pan), edit mode, the in-progress
 * gesture and the visual prompts drawn for image-prompted detection. One
 * session exists per loaded image; it is inert until the image size is known.
 *
 * Invalid requests (unknown size, out-of-range index, degenerate geometry)
 * are no-ops that return false.
 *
 * Usage:
 * @code
 *   AnnotationSession session;
 *   session.setImageSize({640, 480});
 *   session.setMode(EditMode::DRAW);
 *   session.pointerDown({{10, 10}});
 *   session.pointerMove({{80, 60}});
 *   session.pointerUp({{80, 60}});
 *   // session.objectSet()->size() == 1
 * @endcode
 */
class AnnotationSession {
public:
    explicit AnnotationSession(SessionConfig config = {});
    ~AnnotationSession();

    AnnotationSession(AnnotationSession&&);
    AnnotationSession& operator=(AnnotationSession&&);
    AnnotationSession(const AnnotationSession&) = delete;
    AnnotationSession& operator=(const AnnotationSession&) = delete;

    // ------------------------------------------------------------------
    // Image
    // ------------------------------------------------------------------
    bool setImageSize(const cv::Size& size);
    const cv::Size& imageSize() const { return view_.image_size; }
    bool isReady() const { return view_.valid(); }

    // ------------------------------------------------------------------
    // Object set
    // ------------------------------------------------------------------
    bool hasObjectSet() const { return objects_.has_value(); }
    store::ObjectSet* objectSet();
    const store::ObjectSet* objectSet() const;
    store::ObjectSet& ensureObjectSet();

    // Vocabulary of an object set created by a hand-drawn box. Also fills in
    // an existing set that has no class names yet.
    void setDefaultClassNames(std::vector<std::string> class_names);

    /**
     * @brief Replace the object set with a detector result
     *
     * The previous set is discarded, not merged. Switches to SELECT mode.
     */
    void commitDetections(std::vector<store::AnnotatedObject> objects,
                          std::vector<std::string> class_names);

    // Detector failure: empty set plus a message for the user.
    void failDetections(const std::string& message);

    const std::string& statusMessage() const { return status_message_; }

    // ------------------------------------------------------------------
    // Modes
    // ------------------------------------------------------------------
    EditMode mode() const;

    // Cancels any gesture in progress. Entering PAN clears the selection.
    void setMode(EditMode mode);

    infer::Workflow workflow() const { return workflow_; }

    // IMAGE_PROMPT defaults to DRAW, the other workflows to SELECT.
    void setWorkflow(infer::Workflow workflow);

    // ------------------------------------------------------------------
    // Input
    // ------------------------------------------------------------------
    void pointerDown(const PointerEvent& event);
    void pointerMove(const PointerEvent& event);
    void pointerUp(const PointerEvent& event);

    // Delete key: removes the selected object.
    bool deleteSelected();

    // Escape key: drops the gesture and the selection, nothing is committed.
    void cancel();

    // ------------------------------------------------------------------
    // Object edits (SELECT mode only for geometry and selection)
    // ------------------------------------------------------------------
    bool selectObject(std::size_t index);
    void clearSelection();
    std::optional<std::size_t> selectedIndex() const;

    bool toggleVisibility(std::size_t index);
    bool setObjectClass(std::size_t index, int class_id);

    // Drag of the object body by (dx, dy) image pixels.
    bool translateObject(std::size_t index, double dx, double dy);

    // Resize around the top-left corner. Rejects factors <= 0 and results
    // below the minimum resize size.
    bool resizeObject(std::size_t index, double scale_x, double scale_y);

    // ------------------------------------------------------------------
    // View
    // ------------------------------------------------------------------
    const ViewState& view() const { return view_; }
    bool setScale(double scale);
    void setContainer(const cv::Size& container);

    // Pan back to the origin and the fit-to-view scale.
    void resetView();

    // Called when this image becomes the active one: the view is reset and
    // any gesture or selection from before is dropped.
    void activate();

    // Called when another image becomes the active one: a gesture in
    // progress is dropped.
    void deactivate();

    // ------------------------------------------------------------------
    // Gesture / prompts
    // ------------------------------------------------------------------
    const Gesture& gesture() const { return gesture_; }

    // Candidate box of an in-progress draw, in image space.
    std::optional<cv::Rect2d> draftBox() const;

    const infer::VisualPrompt& visualPrompts() const { return visual_prompts_; }
    void clearVisualPrompts();

    const SessionConfig& config() const { return config_; }

private:
    friend class SelectModeHandler;
    friend class DrawModeHandler;
    friend class PanModeHandler;

    cv::Point2d toImage(const cv::Point2d& view_point) const;
    void beginGesture(GestureKind kind, const PointerEvent& event);
    void endGesture();

    // Commits a finished draw into the prompts or the object set.
    bool commitDraftBox(const cv::Rect2d& box);

    bool applyTranslate(store::ObjectId id, double dx, double dy);
    bool applyResize(store::ObjectId id, double scale_x, double scale_y);

    SessionConfig config_;
    ViewState view_;
    Gesture gesture_;
    ModeHandlerPtr handler_;
    infer::Workflow workflow_ = infer::Workflow::PROMPT_FREE;
    std::optional<store::ObjectSet> objects_;
    infer::VisualPrompt visual_prompts_;
    std::string status_message_;
    std::vector<std::string> default_class_names_;
};

} // namespace annokit::interaction
