#include "annokit/capture/ImageFolder.hpp"

#include <algorithm>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>

#include "annokit/common/StringUtils.hpp"
#include "annokit/common/log.hpp"

namespace annokit::capture {

ImageFolder::ImageFolder() = default;
ImageFolder::~ImageFolder() = default;

bool ImageFolder::isImageFile(const std::string& path) {
  static const std::vector<std::string> extensions = {".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff", ".webp"};
  const std::string ext = common::toLowerCopy(std::filesystem::path(path).extension().string());
  return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

bool ImageFolder::open(const std::string& folder_path) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(folder_path, ec)) {
    LOGE("Folder does not exist: ", folder_path);
    return false;
  }

  folder_path_ = folder_path;
  image_files_.clear();
  current_index_ = 0;

  for (const auto& entry : fs::directory_iterator(folder_path_, ec)) {
    if (entry.is_regular_file() && isImageFile(entry.path().string())) {
      image_files_.push_back(entry.path().string());
    }
  }
  if (ec) {
    LOGE("Failed to list folder ", folder_path, ": ", ec.message());
    return false;
  }

  std::sort(image_files_.begin(), image_files_.end());
  is_opened_ = !image_files_.empty();

  if (image_files_.empty()) {
    LOGW("No image files found in folder: ", folder_path);
  } else {
    LOGI("Found ", image_files_.size(), " images in folder");
  }

  return is_opened_;
}

bool ImageFolder::next(ImageEntry& entry) {
  while (is_opened_ && current_index_ < image_files_.size()) {
    const std::string current_file = image_files_[current_index_++];
    const cv::Size size = probeSize(current_file);
    if (size.width <= 0 || size.height <= 0) {
      LOGW("Failed to read image: ", current_file);
      continue;
    }
    entry.path = current_file;
    entry.name = std::filesystem::path(current_file).filename().string();
    entry.size = size;
    return true;
  }
  return false;
}

void ImageFolder::release() {
  image_files_.clear();
  current_index_ = 0;
  is_opened_ = false;
}

bool ImageFolder::isOpened() const { return is_opened_; }

int ImageFolder::getTotalImages() const { return static_cast<int>(image_files_.size()); }

int ImageFolder::getCurrentIndex() const { return static_cast<int>(current_index_); }

SourceType ImageFolder::getType() const { return SourceType::FOLDER; }

cv::Size ImageFolder::probeSize(const std::string& path) {
  const cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
  return image.empty() ? cv::Size(0, 0) : image.size();
}

} // namespace annokit::capture
