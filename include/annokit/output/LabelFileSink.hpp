#pragma once

#include <string>

#include "annokit/output/ILabelSink.hpp"

namespace annokit::output {

/**
 * @brief Writes one <stem>.txt per image into a directory
 *
 * The stem is the image name without its extension, sanitized so that only
 * alphanumerics, '_' and '-' remain. open() creates the directory.
 */
class LabelFileSink : public ILabelSink {
public:
  LabelFileSink();
  ~LabelFileSink() override;

  bool open(const std::string& directory = "") override;
  bool write(const LabelFile& labels) override;
  void close() override;
  bool isOpened() const override;

  SinkType getType() const override;

  const std::string& directory() const { return directory_; }
  size_t filesWritten() const { return files_written_; }

  static std::string labelFileName(const std::string& image_name);

private:
  std::string directory_;
  bool is_opened_ = false;
  size_t files_written_ = 0;
};

} // namespace annokit::output
