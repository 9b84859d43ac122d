#pragma once

#include <memory>

#include "annokit/interaction/InteractionTypes.hpp"

namespace annokit::interaction {

class AnnotationSession;

/**
 * @brief Pointer semantics of one edit mode
 *
 * The session owns exactly one handler, swapped on every mode switch.
 * Handlers are stateless; gesture state lives in the session.
 */
class IModeHandler {
public:
    virtual ~IModeHandler() = default;

    virtual void onPointerDown(AnnotationSession& session, const PointerEvent& event) = 0;
    virtual void onPointerMove(AnnotationSession& session, const PointerEvent& event) = 0;
    virtual void onPointerUp(AnnotationSession& session, const PointerEvent& event) = 0;

    virtual EditMode mode() const = 0;
};

using ModeHandlerPtr = std::unique_ptr<IModeHandler>;

// Click selects, body drag translates, handle drag scales, empty click deselects.
class SelectModeHandler : public IModeHandler {
public:
    void onPointerDown(AnnotationSession& session, const PointerEvent& event) override;
    void onPointerMove(AnnotationSession& session, const PointerEvent& event) override;
    void onPointerUp(AnnotationSession& session, const PointerEvent& event) override;
    EditMode mode() const override { return EditMode::SELECT; }
};

// Press-drag-release on the canvas creates a box.
class DrawModeHandler : public IModeHandler {
public:
    void onPointerDown(AnnotationSession& session, const PointerEvent& event) override;
    void onPointerMove(AnnotationSession& session, const PointerEvent& event) override;
    void onPointerUp(AnnotationSession& session, const PointerEvent& event) override;
    EditMode mode() const override { return EditMode::DRAW; }
};

// Pointer movement is added to the pan offset unscaled.
class PanModeHandler : public IModeHandler {
public:
    void onPointerDown(AnnotationSession& session, const PointerEvent& event) override;
    void onPointerMove(AnnotationSession& session, const PointerEvent& event) override;
    void onPointerUp(AnnotationSession& session, const PointerEvent& event) override;
    EditMode mode() const override { return EditMode::PAN; }
};

ModeHandlerPtr createModeHandler(EditMode mode);

} // namespace annokit::interaction
