#include "annokit/interaction/EventScript.hpp"

#include <optional>

#include "annokit/common/StringUtils.hpp"
#include "annokit/common/log.hpp"

namespace annokit::interaction {

namespace {

std::optional<infer::Workflow> workflowFromString(const std::string& name) {
    const std::string lower = common::toLowerCopy(name);
    if (lower == "prompt_free" || lower == "prompt-free") return infer::Workflow::PROMPT_FREE;
    if (lower == "text_prompt" || lower == "text-prompt") return infer::Workflow::TEXT_PROMPT;
    if (lower == "image_prompt" || lower == "image-prompt") return infer::Workflow::IMAGE_PROMPT;
    return std::nullopt;
}

PointerEvent parsePointer(const YAML::Node& node) {
    PointerEvent ev;
    ev.position = cv::Point2d(node["x"].as<double>(0.0), node["y"].as<double>(0.0));
    if (node["target"]) {
        ev.object_index = node["target"].as<std::size_t>();
        ev.target = node["handle"].as<bool>(false) ? PointerTarget::RESIZE_HANDLE
                                                   : PointerTarget::OBJECT;
    }
    return ev;
}

std::optional<ScriptEvent> parseEvent(const YAML::Node& node) {
    const std::string type = common::toLowerCopy(node["type"].as<std::string>(""));
    ScriptEvent ev;

    if (type == "mode") {
        auto mode = editModeFromString(node["mode"].as<std::string>(""));
        if (!mode) return std::nullopt;
        ev.type = ScriptEventType::MODE;
        ev.mode = *mode;
    } else if (type == "workflow") {
        auto workflow = workflowFromString(node["workflow"].as<std::string>(""));
        if (!workflow) return std::nullopt;
        ev.type = ScriptEventType::WORKFLOW;
        ev.workflow = *workflow;
    } else if (type == "down" || type == "move" || type == "up") {
        ev.type = type == "down" ? ScriptEventType::POINTER_DOWN
                : type == "move" ? ScriptEventType::POINTER_MOVE
                                 : ScriptEventType::POINTER_UP;
        ev.pointer = parsePointer(node);
    } else if (type == "drag") {
        ev.type = ScriptEventType::DRAG;
        ev.index = node["index"].as<std::size_t>();
        ev.a = node["dx"].as<double>(0.0);
        ev.b = node["dy"].as<double>(0.0);
    } else if (type == "resize") {
        ev.type = ScriptEventType::RESIZE;
        ev.index = node["index"].as<std::size_t>();
        ev.a = node["sx"].as<double>(1.0);
        ev.b = node["sy"].as<double>(1.0);
    } else if (type == "class") {
        ev.type = ScriptEventType::SET_CLASS;
        ev.index = node["index"].as<std::size_t>();
        ev.class_id = node["class_id"].as<int>();
    } else if (type == "toggle") {
        ev.type = ScriptEventType::TOGGLE_VISIBILITY;
        ev.index = node["index"].as<std::size_t>();
    } else if (type == "select") {
        ev.type = ScriptEventType::SELECT;
        ev.index = node["index"].as<std::size_t>();
    } else if (type == "zoom") {
        ev.type = ScriptEventType::ZOOM;
        ev.a = node["scale"].as<double>();
    } else if (type == "reset_view") {
        ev.type = ScriptEventType::RESET_VIEW;
    } else if (type == "delete") {
        ev.type = ScriptEventType::DELETE;
    } else if (type == "escape") {
        ev.type = ScriptEventType::ESCAPE;
    } else {
        return std::nullopt;
    }
    return ev;
}

} // namespace

std::vector<ScriptEvent> EventScript::parse(const YAML::Node& root) {
    std::vector<ScriptEvent> events;
    if (!root.IsSequence()) {
        LOGE("EventScript: top-level node is not a sequence");
        return events;
    }
    for (size_t i = 0; i < root.size(); ++i) {
        try {
            auto ev = parseEvent(root[i]);
            if (!ev) {
                LOGW("EventScript: skipping unknown event ", i);
                continue;
            }
            events.push_back(*ev);
        } catch (const YAML::Exception& e) {
            LOGW("EventScript: skipping malformed event ", i, ": ", e.what());
        }
    }
    return events;
}

std::vector<ScriptEvent> EventScript::loadFile(const std::string& path) {
    try {
        return parse(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        LOGE("Event script not readable: ", path);
    } catch (const YAML::Exception& e) {
        LOGE("Failed to parse event script '", path, "': ", e.what());
    }
    return {};
}

std::size_t EventScript::apply(AnnotationSession& session, const std::vector<ScriptEvent>& events) {
    std::size_t accepted = 0;
    for (const auto& ev : events) {
        bool ok = true;
        switch (ev.type) {
            case ScriptEventType::MODE: session.setMode(ev.mode); break;
            case ScriptEventType::WORKFLOW: session.setWorkflow(ev.workflow); break;
            case ScriptEventType::POINTER_DOWN: session.pointerDown(ev.pointer); break;
            case ScriptEventType::POINTER_MOVE: session.pointerMove(ev.pointer); break;
            case ScriptEventType::POINTER_UP: session.pointerUp(ev.pointer); break;
            case ScriptEventType::DRAG: ok = session.translateObject(ev.index, ev.a, ev.b); break;
            case ScriptEventType::RESIZE: ok = session.resizeObject(ev.index, ev.a, ev.b); break;
            case ScriptEventType::DELETE: ok = session.deleteSelected(); break;
            case ScriptEventType::ESCAPE: session.cancel(); break;
            case ScriptEventType::SET_CLASS: ok = session.setObjectClass(ev.index, ev.class_id); break;
            case ScriptEventType::TOGGLE_VISIBILITY: ok = session.toggleVisibility(ev.index); break;
            case ScriptEventType::SELECT: ok = session.selectObject(ev.index); break;
            case ScriptEventType::ZOOM: ok = session.setScale(ev.a); break;
            case ScriptEventType::RESET_VIEW: session.resetView(); break;
        }
        if (ok) ++accepted;
    }
    return accepted;
}

} // namespace annokit::interaction
