#pragma once

#include <vector>
#include "annokit/capture/IImageSource.hpp"

namespace annokit::capture {

class ImageFolder : public IImageSource {
public:
  ImageFolder();
  ~ImageFolder() override;

  bool open(const std::string& folder_path) override;
  bool next(ImageEntry& entry) override;
  void release() override;
  bool isOpened() const override;

  int getTotalImages() const override;
  int getCurrentIndex() const override;
  SourceType getType() const override;

  const std::vector<std::string>& files() const { return image_files_; }

  // Pixel size of an image file, 0x0 when it cannot be decoded.
  static cv::Size probeSize(const std::string& path);
  static bool isImageFile(const std::string& path);

private:
  std::string folder_path_;
  std::vector<std::string> image_files_;
  size_t current_index_ = 0;
  bool is_opened_ = false;
};

} // namespace annokit::capture
