#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "annokit/interaction/AnnotationSession.hpp"

namespace annokit::interaction {

enum class ScriptEventType {
    MODE,
    WORKFLOW,
    POINTER_DOWN,
    POINTER_MOVE,
    POINTER_UP,
    DRAG,
    RESIZE,
    DELETE,
    ESCAPE,
    SET_CLASS,
    TOGGLE_VISIBILITY,
    SELECT,
    ZOOM,
    RESET_VIEW
};

struct ScriptEvent {
    ScriptEventType type = ScriptEventType::ESCAPE;
    EditMode mode = EditMode::SELECT;
    infer::Workflow workflow = infer::Workflow::PROMPT_FREE;
    PointerEvent pointer;
    std::size_t index = 0;
    double a = 0.0;     // dx / scale_x / zoom
    double b = 0.0;     // dy / scale_y
    int class_id = 0;
};

/**
 * @brief Recorded input for driving a session without a UI
 *
 * A YAML sequence of maps, one per event:
 *
 * @code
 *   - {type: mode, mode: draw}
 *   - {type: down, x: 10, y: 10}
 *   - {type: move, x: 80, y: 60}
 *   - {type: up, x: 80, y: 60}
 *   - {type: down, x: 40, y: 40, target: 0}          # object body
 *   - {type: down, x: 80, y: 60, target: 0, handle: true}
 *   - {type: drag, index: 0, dx: 5, dy: -3}
 *   - {type: resize, index: 0, sx: 1.5, sy: 1.0}
 *   - {type: class, index: 0, class_id: 2}
 *   - {type: toggle, index: 1}
 *   - {type: delete}
 * @endcode
 *
 * Other types: escape, select (index), zoom (scale), reset_view,
 * workflow (prompt_free|text_prompt|image_prompt). Unknown or malformed
 * entries are skipped with a warning.
 */
class EventScript {
public:
    static std::vector<ScriptEvent> parse(const YAML::Node& root);
    static std::vector<ScriptEvent> loadFile(const std::string& path);

    // Returns the number of events the session accepted.
    static std::size_t apply(AnnotationSession& session, const std::vector<ScriptEvent>& events);
};

} // namespace annokit::interaction
