#include "annokit/workspace/Workspace.hpp"

#include <utility>

#include "annokit/common/log.hpp"
#include "annokit/post/Postprocess.hpp"

namespace annokit::workspace {

Workspace::Workspace(interaction::SessionConfig config) : config_(config) {}

ImageId Workspace::addImage(const std::string& name, const std::string& path, const cv::Size& size) {
    ImageRecord record;
    record.id = next_id_++;
    record.name = name;
    record.path = path;

    auto session = std::make_unique<interaction::AnnotationSession>(config_);
    session->setWorkflow(workflow_);
    session->setDefaultClassNames(class_names_);
    if (geometry::isValidSize(size)) {
        record.size = size;
        session->setImageSize(size);
    }

    images_.push_back(std::move(record));
    sessions_.push_back(std::move(session));

    std::size_t index = active_ ? *active_ + 1 : 0;
    if (index >= images_.size()) index = images_.size() - 1;
    activate(index);

    LOGD("Workspace: added ", name, " (", images_.size(), " images)");
    return images_.back().id;
}

bool Workspace::removeImage(ImageId id) {
    const auto index = indexOf(id);
    if (!index) {
        return false;
    }
    if (active_ && *index <= *active_) {
        sessions_[*active_]->deactivate();
    }
    images_.erase(images_.begin() + static_cast<std::ptrdiff_t>(*index));
    sessions_.erase(sessions_.begin() + static_cast<std::ptrdiff_t>(*index));

    if (images_.empty()) {
        active_.reset();
        return true;
    }
    // The active position is kept and clamped, so the image shown changes
    // whenever the removed one sat at or before it.
    const std::size_t previous = active_.value_or(0);
    std::size_t current = previous;
    if (current >= images_.size()) {
        current = images_.size() - 1;
    }
    if (*index <= previous) {
        active_.reset();
        activate(current);
    } else {
        active_ = current;
    }
    return true;
}

bool Workspace::goTo(std::size_t index) {
    if (index >= images_.size()) {
        return false;
    }
    if (active_ && *active_ == index) {
        return true;
    }
    activate(index);
    return true;
}

bool Workspace::next() {
    if (!active_ || *active_ + 1 >= images_.size()) {
        return false;
    }
    activate(*active_ + 1);
    return true;
}

bool Workspace::prev() {
    if (!active_ || *active_ == 0) {
        return false;
    }
    activate(*active_ - 1);
    return true;
}

bool Workspace::setImageSize(ImageId id, const cv::Size& size) {
    const auto index = indexOf(id);
    if (!index || !geometry::isValidSize(size)) {
        return false;
    }
    images_[*index].size = size;
    auto& session = *sessions_[*index];
    session.setImageSize(size);
    if (active_ && *active_ == *index) {
        session.resetView();
    }
    return true;
}

bool Workspace::commitDetections(ImageId id, const infer::DetectionResult& result) {
    auto* target = session(id);
    if (!target) {
        return false;
    }
    std::vector<std::string> classes = result.classes.empty() ? class_names_ : result.classes;
    auto objects = post::Postprocess::toObjects(result, classes);
    target->commitDetections(std::move(objects), std::move(classes));
    return true;
}

bool Workspace::runDetection(infer::IDetectionProvider& provider, const std::vector<std::string>& text) {
    const ImageRecord* image = activeImage();
    if (!image) {
        LOGW("Workspace: no active image to run ", provider.name(), " on");
        return false;
    }
    auto& target = *sessions_[*active_];
    if (!target.isReady()) {
        LOGW("Workspace: size of ", image->name, " is unknown");
        return false;
    }

    infer::DetectionPrompt prompt;
    prompt.workflow = target.workflow();
    if (prompt.workflow == infer::Workflow::TEXT_PROMPT) {
        prompt.text = text;
    } else if (prompt.workflow == infer::Workflow::IMAGE_PROMPT) {
        prompt.visual = target.visualPrompts();
    }

    auto result = provider.detect(image->path, image->size, prompt);
    if (!result) {
        target.failDetections("Detection failed for " + image->name);
        return false;
    }
    const ImageId id = image->id;
    commitDetections(id, *result);
    if (prompt.workflow == infer::Workflow::IMAGE_PROMPT) {
        target.clearVisualPrompts();
    }
    LOGI("Workspace: ", provider.name(), " found ", result->detections.size(), " objects in ",
         image->name);
    return true;
}

void Workspace::setClassNames(std::vector<std::string> class_names) {
    class_names_ = std::move(class_names);
    for (auto& session : sessions_) {
        session->setDefaultClassNames(class_names_);
    }
}

void Workspace::setWorkflow(infer::Workflow workflow) {
    workflow_ = workflow;
    for (auto& session : sessions_) {
        session->setWorkflow(workflow);
    }
}

std::optional<std::size_t> Workspace::indexOf(ImageId id) const {
    for (std::size_t i = 0; i < images_.size(); ++i) {
        if (images_[i].id == id) return i;
    }
    return std::nullopt;
}

const ImageRecord* Workspace::activeImage() const {
    return active_ ? &images_[*active_] : nullptr;
}

interaction::AnnotationSession* Workspace::activeSession() {
    return active_ ? sessions_[*active_].get() : nullptr;
}

interaction::AnnotationSession* Workspace::session(ImageId id) {
    const auto index = indexOf(id);
    return index ? sessions_[*index].get() : nullptr;
}

const interaction::AnnotationSession* Workspace::session(ImageId id) const {
    const auto index = indexOf(id);
    return index ? sessions_[*index].get() : nullptr;
}

std::string Workspace::exportImage(ImageId id, const output::ClassMap& class_map) const {
    const auto index = indexOf(id);
    if (!index) {
        return {};
    }
    const auto& target = *sessions_[*index];
    const auto* objects = target.objectSet();
    if (!objects || !target.isReady()) {
        return {};
    }
    return output::YoloExport::exportObjectSet(*objects, images_[*index].size, class_map);
}

std::size_t Workspace::exportAll(output::ILabelSink& sink, const output::ClassMap& class_map) const {
    if (!sink.isOpened()) {
        LOGE("Workspace: label sink is not open");
        return 0;
    }
    std::size_t written = 0;
    for (const auto& image : images_) {
        if (!geometry::isValidSize(image.size)) {
            LOGW("Workspace: skipping ", image.name, ", size unknown");
            continue;
        }
        output::LabelFile file;
        file.image_name = image.name;
        file.content = exportImage(image.id, class_map);
        if (sink.write(file)) {
            ++written;
        }
    }
    return written;
}

void Workspace::activate(std::optional<std::size_t> index) {
    if (active_ && *active_ < sessions_.size()) {
        sessions_[*active_]->deactivate();
    }
    active_ = index;
    if (active_) {
        sessions_[*active_]->activate();
    }
}

} // namespace annokit::workspace
