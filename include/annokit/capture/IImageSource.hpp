#pragma once

#include <memory>
#include <string>
#include <opencv2/core.hpp>

namespace annokit::capture {

enum class SourceType {
    FOLDER
};

struct ImageEntry {
    std::string path;
    std::string name;      // file name with extension
    cv::Size size{0, 0};   // pixel dimensions, 0x0 until probed
};

class IImageSource {
public:
    virtual ~IImageSource() = default;

    virtual bool open(const std::string& uri) = 0;

    // Next image with its dimensions. false when exhausted.
    virtual bool next(ImageEntry& entry) = 0;
    virtual void release() = 0;
    virtual bool isOpened() const = 0;

    virtual int getTotalImages() const = 0;
    virtual int getCurrentIndex() const = 0;

    virtual SourceType getType() const = 0;
};

using ImageSourcePtr = std::unique_ptr<IImageSource>;

} // namespace annokit::capture
