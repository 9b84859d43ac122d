#pragma once

#include <cstdint>
#include <optional>

#include "annokit/geometry/CoordTransform.hpp"

namespace annokit::store {

using ObjectId = std::uint64_t;

struct AnnotatedObject {
    ObjectId id = 0;                        // assigned by the owning ObjectSet
    int class_id = 0;
    geometry::NormBox bbox;                 // normalized corners, x1 <= x2, y1 <= y2
    std::optional<geometry::Mask> mask;     // absolute pixel polygon
    float confidence = 1.0f;                // [0-1]
    bool visible = true;
};

} // namespace annokit::store
