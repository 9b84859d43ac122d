#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "annokit/store/AnnotatedObject.hpp"

namespace annokit::store {

/**
 * @brief Ordered collection of annotated objects for one image
 *
 * Objects are addressed by position from the outside. Visibility, selection
 * and hover are tracked against the object's stable id, so removing an object
 * shifts the hidden positions above it down by one without any bookkeeping.
 *
 * Mutations with an out-of-range index are no-ops and return false.
 */
class ObjectSet {
public:
    ObjectSet() = default;
    explicit ObjectSet(std::vector<std::string> class_names);

    // Appends with confidence 1 and visible. Returns the new index, or
    // nullopt for a negative class id.
    std::optional<std::size_t> add(const geometry::NormBox& bbox, int class_id,
                                   std::optional<geometry::Mask> mask = std::nullopt);

    // Replaces geometry only. The mask is kept when none is given.
    bool update(std::size_t index, const geometry::NormBox& bbox,
                std::optional<geometry::Mask> mask = std::nullopt);

    bool remove(std::size_t index);
    // Rejects ids outside a non-empty vocabulary.
    bool setClass(std::size_t index, int class_id);

    // Hiding the selected object clears the selection.
    bool toggleVisibility(std::size_t index);

    // Atomic replacement with a new detection result. Ids are reassigned,
    // every object becomes visible and selection/hover are cleared.
    void replaceAll(std::vector<AnnotatedObject> objects);
    void clear();

    // Hidden objects cannot be selected.
    bool select(std::size_t index);
    void clearSelection();
    std::optional<std::size_t> selectedIndex() const;

    void setHovered(std::optional<std::size_t> index);
    std::optional<std::size_t> hoveredIndex() const;

    bool isHidden(std::size_t index) const;
    std::vector<std::size_t> hiddenIndices() const;

    std::size_t size() const { return objects_.size(); }
    bool empty() const { return objects_.empty(); }
    const AnnotatedObject* at(std::size_t index) const;
    const std::vector<AnnotatedObject>& objects() const { return objects_; }
    std::optional<std::size_t> indexOf(ObjectId id) const;

    const std::vector<std::string>& classNames() const { return class_names_; }
    void setClassNames(std::vector<std::string> class_names);

    // Empty string when class_id is outside the vocabulary.
    std::string className(int class_id) const;

    // Index of the name in the vocabulary, appending it when missing.
    int resolveClass(const std::string& class_name);

    // Number of objects per class id.
    std::map<int, int> classCounts() const;

private:
    ObjectId nextId() { return next_id_++; }
    std::optional<std::size_t> indexOfOptional(const std::optional<ObjectId>& id) const;

    std::vector<AnnotatedObject> objects_;
    std::vector<std::string> class_names_;
    std::optional<ObjectId> selected_;
    std::optional<ObjectId> hovered_;
    ObjectId next_id_ = 1;
};

} // namespace annokit::store
