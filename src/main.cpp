#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <opencv2/imgcodecs.hpp>

#include "annokit/capture/ImageFolder.hpp"
#include "annokit/common/log.hpp"
#include "annokit/config/AppConfig.hpp"
#include "annokit/infer/DetectionFileProvider.hpp"
#include "annokit/interaction/EventScript.hpp"
#include "annokit/output/LabelFileSink.hpp"
#include "annokit/output/YoloExport.hpp"
#include "annokit/render/OverlayRenderer.hpp"
#include "annokit/workspace/Workspace.hpp"

namespace {

void printUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [options]\n";
  std::cout << "Options:\n";
  std::cout << "  --cfg <path>          Configuration file (default: config/annokit.yaml)\n";
  std::cout << "  --images <dir>        Image folder (overrides io.images)\n";
  std::cout << "  --detections <dir>    Detection files folder (overrides io.detections)\n";
  std::cout << "  --labels <dir>        Output folder for YOLO labels (overrides io.labels)\n";
  std::cout << "  --events <file>       Event script replayed on the first image\n";
  std::cout << "  --save_vis <dir>      Save rendered overlays to directory\n";
  std::cout << "  --log-level <lvl>     Set log level (TRACE/DEBUG/INFO/WARN/ERROR)\n";
  std::cout << "  --help                Show this help message\n";
}

// Configured vocabulary first, then any name an image introduced.
std::vector<std::string> collectClassNames(const annokit::workspace::Workspace& workspace) {
  std::vector<std::string> names = workspace.classNames();
  for (const auto& image : workspace.images()) {
    const auto* session = workspace.session(image.id);
    if (!session || !session->objectSet()) continue;
    for (const auto& name : session->objectSet()->classNames()) {
      if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
      }
    }
  }
  return names;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace annokit;

  std::string config_path = "config/annokit.yaml";
  std::string images_override;
  std::string detections_override;
  std::string labels_override;
  std::string events_override;
  std::string save_vis_dir;
  std::string log_level_override;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--cfg" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--images" && i + 1 < argc) {
      images_override = argv[++i];
    } else if (arg == "--detections" && i + 1 < argc) {
      detections_override = argv[++i];
    } else if (arg == "--labels" && i + 1 < argc) {
      labels_override = argv[++i];
    } else if (arg == "--events" && i + 1 < argc) {
      events_override = argv[++i];
    } else if (arg == "--save_vis" && i + 1 < argc) {
      save_vis_dir = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else {
      LOGE("Unknown argument: ", arg);
      printUsage(argv[0]);
      return 1;
    }
  }

  config::AppConfig cfg = config::loadConfig(config_path);
  if (!images_override.empty()) cfg.images_dir = images_override;
  if (!detections_override.empty()) cfg.detections_dir = detections_override;
  if (!labels_override.empty()) cfg.labels_dir = labels_override;
  if (!events_override.empty()) cfg.events_path = events_override;
  if (!save_vis_dir.empty()) cfg.overlays_dir = save_vis_dir;
  if (!log_level_override.empty()) cfg.log_level = log_level_override;

  aklog::g_level.store(aklog::levelFromString(cfg.log_level), std::memory_order_relaxed);

  if (cfg.images_dir.empty()) {
    LOGE("No image folder given (--images or io.images)");
    printUsage(argv[0]);
    return 1;
  }

  LOGI("=== Annotation batch ===");
  LOGI("Images: ", cfg.images_dir);
  LOGI("Detections: ", cfg.detections_dir.empty() ? "<none>" : cfg.detections_dir);
  LOGI("Labels: ", cfg.labels_dir);

  capture::ImageFolder folder;
  if (!folder.open(cfg.images_dir)) {
    LOGE("Failed to open image folder: ", cfg.images_dir);
    return 1;
  }

  workspace::Workspace workspace(cfg.sessionConfig());
  workspace.setClassNames(cfg.resolveClassNames());

  capture::ImageEntry entry;
  while (folder.next(entry)) {
    workspace.addImage(entry.name, entry.path, entry.size);
  }
  if (workspace.empty()) {
    LOGE("No readable images in ", cfg.images_dir);
    return 1;
  }
  LOGI("Loaded ", workspace.size(), " images");

  if (!cfg.detections_dir.empty()) {
    infer::DetectionFileProvider provider(cfg.detections_dir);
    for (std::size_t i = 0; i < workspace.size(); ++i) {
      workspace.goTo(i);
      const auto* image = workspace.activeImage();
      if (provider.findFileFor(image->path).empty()) {
        LOGD("No detections for ", image->name);
        continue;
      }
      workspace.runDetection(provider);
    }
  }

  if (!cfg.events_path.empty()) {
    workspace.goTo(0);
    const auto events = interaction::EventScript::loadFile(cfg.events_path);
    const std::size_t accepted = interaction::EventScript::apply(*workspace.activeSession(), events);
    LOGI("Replayed ", accepted, "/", events.size(), " events on ", workspace.activeImage()->name);
  }

  const auto class_names = collectClassNames(workspace);
  const auto class_map = output::YoloExport::buildClassMap(class_names);

  output::LabelFileSink sink;
  if (!sink.open(cfg.labels_dir)) {
    LOGE("Failed to open label directory: ", cfg.labels_dir);
    return 1;
  }
  const std::size_t written = workspace.exportAll(sink, class_map);
  sink.close();
  LOGI("Wrote ", written, " label files to ", cfg.labels_dir, " (", class_names.size(), " classes)");

  if (!cfg.overlays_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.overlays_dir, ec);
    if (ec) {
      LOGE("Cannot create overlay directory ", cfg.overlays_dir, ": ", ec.message());
      return 1;
    }
    for (const auto& image : workspace.images()) {
      const cv::Mat pixels = cv::imread(image.path, cv::IMREAD_COLOR);
      if (pixels.empty()) {
        LOGW("Failed to read ", image.path, " for overlay");
        continue;
      }
      const cv::Mat vis = render::OverlayRenderer::render(pixels, *workspace.session(image.id));
      const std::string out_path = (std::filesystem::path(cfg.overlays_dir) / image.name).string();
      if (!cv::imwrite(out_path, vis)) {
        LOGW("Failed to write overlay ", out_path);
      }
    }
  }

  LOGI("Done");
  return 0;
}
