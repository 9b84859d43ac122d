#pragma once

#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "annokit/store/ObjectSet.hpp"

namespace annokit::output {

using ClassMap = std::map<std::string, int>;

// One object to export: absolute {x, y, width, height} plus its label.
struct ExportRecord {
    cv::Rect2d bbox;
    std::string user_label;       // set when the user renamed the object
    std::string category_name;
    std::string original_class;

    // First non-empty of user label, category name, original class.
    const std::string& effectiveName() const;
};

/**
 * @brief YOLO text export
 *
 * Each record becomes "classId xc yc w h", normalized to the image size,
 * clamped to [0,1] and printed with six decimals. Lines are joined by '\n'.
 * Records with an unknown class or non-finite box are skipped with a warning;
 * an empty list or a non-positive image size yields an empty string.
 */
class YoloExport {
public:
    static std::string convert(const std::vector<ExportRecord>& records,
                               int image_width, int image_height,
                               const ClassMap& class_name_to_id);

    // Every object of the set, with its class name from the set's vocabulary.
    static std::vector<ExportRecord> recordsFromObjectSet(const store::ObjectSet& objects,
                                                          const cv::Size& image_size);

    static std::string exportObjectSet(const store::ObjectSet& objects,
                                       const cv::Size& image_size,
                                       const ClassMap& class_name_to_id);

    // name -> position in the list; later duplicates keep the first id.
    static ClassMap buildClassMap(const std::vector<std::string>& class_names);

    static std::string formatLine(int class_id, double xc, double yc, double w, double h);
};

} // namespace annokit::output
