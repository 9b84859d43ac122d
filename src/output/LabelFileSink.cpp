#include "annokit/output/LabelFileSink.hpp"

#include <filesystem>
#include <fstream>

#include "annokit/common/StringUtils.hpp"
#include "annokit/common/log.hpp"

namespace annokit::output {

LabelFileSink::LabelFileSink() = default;
LabelFileSink::~LabelFileSink() { close(); }

bool LabelFileSink::open(const std::string& directory) {
  namespace fs = std::filesystem;
  close();

  directory_ = directory.empty() ? std::string("labels") : directory;
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec || !fs::is_directory(directory_)) {
    LOGE("LabelFileSink: cannot create directory ", directory_, ": ", ec.message());
    return false;
  }

  files_written_ = 0;
  is_opened_ = true;
  return true;
}

bool LabelFileSink::write(const LabelFile& labels) {
  if (!is_opened_) {
    LOGE("LabelFileSink: write on closed sink");
    return false;
  }

  const std::filesystem::path path =
      std::filesystem::path(directory_) / labelFileName(labels.image_name);
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    LOGE("LabelFileSink: failed to open ", path.string());
    return false;
  }
  out << labels.content;
  out.flush();
  if (!out) {
    LOGE("LabelFileSink: failed to write ", path.string());
    return false;
  }

  ++files_written_;
  LOGD("LabelFileSink: wrote ", path.string());
  return true;
}

void LabelFileSink::close() { is_opened_ = false; }

bool LabelFileSink::isOpened() const { return is_opened_; }

SinkType LabelFileSink::getType() const { return SinkType::DIRECTORY; }

std::string LabelFileSink::labelFileName(const std::string& image_name) {
  std::string stem = common::sanitizeFilenameBase(
      std::filesystem::path(image_name).stem().string());
  if (stem.empty()) stem = "annotations";
  return stem + ".txt";
}

} // namespace annokit::output
