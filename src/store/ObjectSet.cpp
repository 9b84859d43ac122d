#include "annokit/store/ObjectSet.hpp"

#include <algorithm>
#include <utility>

#include "annokit/common/log.hpp"

namespace annokit::store {

ObjectSet::ObjectSet(std::vector<std::string> class_names)
    : class_names_(std::move(class_names)) {}

std::optional<std::size_t> ObjectSet::add(const geometry::NormBox& bbox, int class_id,
                                          std::optional<geometry::Mask> mask) {
    if (class_id < 0) {
        LOGW("ObjectSet::add: negative class id ", class_id);
        return std::nullopt;
    }
    AnnotatedObject obj;
    obj.id = nextId();
    obj.class_id = class_id;
    obj.bbox = bbox;
    obj.mask = std::move(mask);
    obj.confidence = 1.0f;
    obj.visible = true;
    objects_.push_back(std::move(obj));
    return objects_.size() - 1;
}

bool ObjectSet::update(std::size_t index, const geometry::NormBox& bbox,
                       std::optional<geometry::Mask> mask) {
    if (index >= objects_.size()) {
        LOGD("ObjectSet::update: index ", index, " out of range");
        return false;
    }
    auto& obj = objects_[index];
    obj.bbox = bbox;
    if (mask) {
        obj.mask = std::move(mask);
    }
    return true;
}

bool ObjectSet::remove(std::size_t index) {
    if (index >= objects_.size()) {
        LOGD("ObjectSet::remove: index ", index, " out of range");
        return false;
    }
    const ObjectId id = objects_[index].id;
    objects_.erase(objects_.begin() + static_cast<std::ptrdiff_t>(index));
    if (selected_ == id) selected_.reset();
    if (hovered_ == id) hovered_.reset();
    return true;
}

bool ObjectSet::setClass(std::size_t index, int class_id) {
    const bool unknown = !class_names_.empty() && class_id >= static_cast<int>(class_names_.size());
    if (index >= objects_.size() || class_id < 0 || unknown) {
        LOGD("ObjectSet::setClass: rejected index ", index, " class ", class_id);
        return false;
    }
    objects_[index].class_id = class_id;
    return true;
}

bool ObjectSet::toggleVisibility(std::size_t index) {
    if (index >= objects_.size()) {
        LOGD("ObjectSet::toggleVisibility: index ", index, " out of range");
        return false;
    }
    auto& obj = objects_[index];
    obj.visible = !obj.visible;
    if (!obj.visible && selected_ == obj.id) {
        selected_.reset();
    }
    return true;
}

void ObjectSet::replaceAll(std::vector<AnnotatedObject> objects) {
    objects_ = std::move(objects);
    for (auto& obj : objects_) {
        obj.id = nextId();
        obj.visible = true;
    }
    selected_.reset();
    hovered_.reset();
}

void ObjectSet::clear() {
    objects_.clear();
    selected_.reset();
    hovered_.reset();
}

bool ObjectSet::select(std::size_t index) {
    if (index >= objects_.size() || !objects_[index].visible) {
        return false;
    }
    selected_ = objects_[index].id;
    return true;
}

void ObjectSet::clearSelection() { selected_.reset(); }

std::optional<std::size_t> ObjectSet::selectedIndex() const {
    return indexOfOptional(selected_);
}

void ObjectSet::setHovered(std::optional<std::size_t> index) {
    if (index && *index < objects_.size()) {
        hovered_ = objects_[*index].id;
    } else {
        hovered_.reset();
    }
}

std::optional<std::size_t> ObjectSet::hoveredIndex() const {
    return indexOfOptional(hovered_);
}

bool ObjectSet::isHidden(std::size_t index) const {
    return index < objects_.size() && !objects_[index].visible;
}

std::vector<std::size_t> ObjectSet::hiddenIndices() const {
    std::vector<std::size_t> hidden;
    for (std::size_t i = 0; i < objects_.size(); ++i) {
        if (!objects_[i].visible) hidden.push_back(i);
    }
    return hidden;
}

const AnnotatedObject* ObjectSet::at(std::size_t index) const {
    return index < objects_.size() ? &objects_[index] : nullptr;
}

std::optional<std::size_t> ObjectSet::indexOf(ObjectId id) const {
    auto it = std::find_if(objects_.begin(), objects_.end(),
                           [id](const AnnotatedObject& obj) { return obj.id == id; });
    if (it == objects_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - objects_.begin());
}

std::optional<std::size_t> ObjectSet::indexOfOptional(const std::optional<ObjectId>& id) const {
    if (!id) return std::nullopt;
    return indexOf(*id);
}

void ObjectSet::setClassNames(std::vector<std::string> class_names) {
    class_names_ = std::move(class_names);
}

std::string ObjectSet::className(int class_id) const {
    if (class_id >= 0 && class_id < static_cast<int>(class_names_.size())) {
        return class_names_[class_id];
    }
    return {};
}

int ObjectSet::resolveClass(const std::string& class_name) {
    auto it = std::find(class_names_.begin(), class_names_.end(), class_name);
    if (it != class_names_.end()) {
        return static_cast<int>(it - class_names_.begin());
    }
    class_names_.push_back(class_name);
    return static_cast<int>(class_names_.size() - 1);
}

std::map<int, int> ObjectSet::classCounts() const {
    std::map<int, int> counts;
    for (const auto& obj : objects_) {
        ++counts[obj.class_id];
    }
    return counts;
}

} // namespace annokit::store
