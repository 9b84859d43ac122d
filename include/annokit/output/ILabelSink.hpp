#pragma once

#include <memory>
#include <string>

namespace annokit::output {

// Serialized labels for one image.
struct LabelFile {
    std::string image_name;   // original image file name, extension included
    std::string content;      // YOLO lines
};

enum class SinkType {
    DIRECTORY
};

class ILabelSink {
public:
    virtual ~ILabelSink() = default;

    virtual bool open(const std::string& config = "") = 0;
    virtual bool write(const LabelFile& labels) = 0;
    virtual void close() = 0;
    virtual bool isOpened() const = 0;

    virtual SinkType getType() const = 0;
};

using LabelSinkPtr = std::unique_ptr<ILabelSink>;

} // namespace annokit::output
