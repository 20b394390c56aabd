#include "zedframe/FrameStateCell.hpp"

#include <utility>

#include "zedframe/Errors.hpp"

namespace zedframe {

FrameStateCell::FrameStateCell(bool depth_enabled) : depth_enabled_(depth_enabled) {}

void FrameStateCell::update(Frame image, std::optional<Frame> depth) {
    std::shared_ptr<const Frame> next_depth;
    if (depth.has_value()) {
        next_depth = std::make_shared<const Frame>(std::move(*depth));
    }
    update(std::make_shared<const Frame>(std::move(image)), std::move(next_depth));
}

void FrameStateCell::update(std::shared_ptr<const Frame> image, std::shared_ptr<const Frame> depth) {
    if (!depth_enabled_) {
        depth.reset();
    }

    // Only the pointer swap is locked; the old frames are freed after unlock.
    std::lock_guard<std::mutex> lock(mutex_);
    image_.swap(image);
    if (depth) {
        depth_.swap(depth);
    }
}

Frame FrameStateCell::snapshotImage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!image_) {
        throw NotReadyError("No image frame captured yet");
    }
    return *image_;
}

Frame FrameStateCell::snapshotDepth() const {
    if (!depth_enabled_) {
        throw NotAvailableError("Depth was not enabled for this sensor");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!depth_) {
        throw NotReadyError("No depth map captured yet");
    }
    return *depth_;
}

void FrameStateCell::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    image_.reset();
    depth_.reset();
}

bool FrameStateCell::ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return image_ != nullptr;
}

} // namespace zedframe
