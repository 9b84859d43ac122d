#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

#include "annokit/infer/IDetectionProvider.hpp"
#include "annokit/interaction/AnnotationSession.hpp"
#include "annokit/output/ILabelSink.hpp"
#include "annokit/output/YoloExport.hpp"

namespace annokit::workspace {

using ImageId = std::uint64_t;

struct ImageRecord {
    ImageId id = 0;
    std::string name;
    std::string path;
    cv::Size size{0, 0};
};

/**
 * @brief Loaded images and their editing sessions
 *
 * Each image owns one AnnotationSession; removing the image destroys it.
 * Switching the active image re-activates the incoming session so no gesture
 * or selection carries over.
 */
class Workspace {
public:
    explicit Workspace(interaction::SessionConfig config = {});

    // Appends the image and makes it active: index 0 for the first image,
    // otherwise one past the previously active index.
    ImageId addImage(const std::string& name, const std::string& path,
                     const cv::Size& size = cv::Size(0, 0));
    bool removeImage(ImageId id);

    bool goTo(std::size_t index);
    bool next();
    bool prev();

    // Ignored for non-positive sizes.
    bool setImageSize(ImageId id, const cv::Size& size);

    // Replaces the image's object set with the detector result.
    bool commitDetections(ImageId id, const infer::DetectionResult& result);

    /**
     * @brief Run a provider on the active image
     *
     * The prompt is built from the active workflow: @p text for TEXT_PROMPT,
     * the session's drawn boxes for IMAGE_PROMPT. A provider failure leaves
     * the image with an empty set and a status message.
     */
    bool runDetection(infer::IDetectionProvider& provider,
                      const std::vector<std::string>& text = {});

    // Vocabulary used when a detection result carries no class names.
    // Also the vocabulary of object sets started by drawing a box.
    void setClassNames(std::vector<std::string> class_names);
    const std::vector<std::string>& classNames() const { return class_names_; }

    // Applies to every session and to images added later.
    void setWorkflow(infer::Workflow workflow);
    infer::Workflow workflow() const { return workflow_; }

    std::size_t size() const { return images_.size(); }
    bool empty() const { return images_.empty(); }
    std::optional<std::size_t> activeIndex() const { return active_; }
    const std::vector<ImageRecord>& images() const { return images_; }
    std::optional<std::size_t> indexOf(ImageId id) const;

    const ImageRecord* activeImage() const;
    interaction::AnnotationSession* activeSession();
    interaction::AnnotationSession* session(ImageId id);
    const interaction::AnnotationSession* session(ImageId id) const;

    // YOLO text for one image, empty when it has no objects or no size.
    std::string exportImage(ImageId id, const output::ClassMap& class_map) const;

    // Writes one label file per image with a known size. Returns the count written.
    std::size_t exportAll(output::ILabelSink& sink, const output::ClassMap& class_map) const;

private:
    void activate(std::optional<std::size_t> index);

    interaction::SessionConfig config_;
    infer::Workflow workflow_ = infer::Workflow::PROMPT_FREE;
    std::vector<std::string> class_names_;
    std::vector<ImageRecord> images_;
    std::vector<std::unique_ptr<interaction::AnnotationSession>> sessions_;
    std::optional<std::size_t> active_;
    ImageId next_id_ = 1;
};

} // namespace annokit::workspace
