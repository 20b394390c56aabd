#pragma once
// Background capture: pull, update the in-process cell, publish to shared buffers.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>

#include "zedframe/FrameSource.hpp"
#include "zedframe/FrameStateCell.hpp"
#include "zedframe/SharedFrameBuffer.hpp"
#include "zedframe/StopToken.hpp"

namespace zedframe {

class AcquisitionLoop {
public:
    // Downstream consumers always get 3 channels; the device's alpha is dropped.
    static constexpr int kPublishedChannels = 3;

    AcquisitionLoop(FrameSource& source, FrameStateCell& cell, CameraView view, bool depth_enabled,
                    std::chrono::milliseconds pacing);

    // Buffers are borrowed; either may be null to skip publishing.
    void setSharedBuffers(SharedFrameBuffer* image_buffer, SharedFrameBuffer* depth_buffer);

    // One pull, cell update and publish. Throws CaptureError or SharedBufferError.
    void cycle();

    // Repeats cycle() until `token` is stopped. A failed cycle ends the loop and
    // is kept in error() instead of escaping the worker thread.
    void run(const StopToken& token);

    bool active() const { return active_.load(); }
    bool faulted() const;
    std::exception_ptr error() const;
    void clearError();

    std::uint64_t cycles() const { return cycles_.load(); }
    std::chrono::milliseconds pacing() const { return pacing_; }

private:
    Frame toPublished(const Frame& raw, FrameKind kind) const;

    FrameSource& source_;
    FrameStateCell& cell_;
    const CameraView view_;
    const bool depth_enabled_;
    const std::chrono::milliseconds pacing_;

    SharedFrameBuffer* image_buffer_ = nullptr;
    SharedFrameBuffer* depth_buffer_ = nullptr;

    std::atomic<bool> active_{false};
    std::atomic<std::uint64_t> cycles_{0};

    mutable std::mutex error_mutex_;
    std::exception_ptr error_;
};

} // namespace zedframe
