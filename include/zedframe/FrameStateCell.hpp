#pragma once
// Latest image and depth map, shared between the acquisition thread and readers.

#include <memory>
#include <mutex>
#include <optional>

#include "zedframe/Frame.hpp"

namespace zedframe {

class FrameStateCell {
public:
    explicit FrameStateCell(bool depth_enabled);

    // Producer side. Replaces both frames under the lock. `depth` is ignored
    // when depth is disabled.
    void update(Frame image, std::optional<Frame> depth = std::nullopt);
    void update(std::shared_ptr<const Frame> image, std::shared_ptr<const Frame> depth);

    // Copies the current frame under the lock.
    // Throws NotReadyError before the first update.
    Frame snapshotImage() const;
    // Throws NotAvailableError when depth is disabled, NotReadyError before
    // the first depth frame.
    Frame snapshotDepth() const;

    void reset();

    bool ready() const;
    bool depthEnabled() const { return depth_enabled_; }

private:
    const bool depth_enabled_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Frame> image_;
    std::shared_ptr<const Frame> depth_;
};

} // namespace zedframe
