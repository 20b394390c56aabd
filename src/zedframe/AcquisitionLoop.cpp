#include "zedframe/AcquisitionLoop.hpp"

#include <memory>
#include <sstream>
#include <utility>

#include "zedframe/Errors.hpp"
#include "zedframe/Logger.hpp"

namespace zedframe {

AcquisitionLoop::AcquisitionLoop(FrameSource& source, FrameStateCell& cell, CameraView view, bool depth_enabled,
                                 std::chrono::milliseconds pacing)
    : source_(source), cell_(cell), view_(view), depth_enabled_(depth_enabled), pacing_(pacing) {}

void AcquisitionLoop::setSharedBuffers(SharedFrameBuffer* image_buffer, SharedFrameBuffer* depth_buffer) {
    image_buffer_ = image_buffer;
    depth_buffer_ = depth_buffer;
}

Frame AcquisitionLoop::toPublished(const Frame& raw, FrameKind kind) const {
    if (raw.empty() || raw.channels < kPublishedChannels || raw.sizeBytes() != raw.shape().bytes()) {
        std::ostringstream oss;
        oss << "Device returned an unusable " << frameKindName(kind) << " (" << raw.shape().toString() << ", "
            << raw.sizeBytes() << " bytes)";
        throw CaptureError(oss.str());
    }
    Frame out = extractChannels(raw, kPublishedChannels);
    out.kind = kind;
    return out;
}

void AcquisitionLoop::cycle() {
    PulledFrames pulled = source_.pull(view_);

    auto image = std::make_shared<const Frame>(toPublished(pulled.image, FrameKind::Image));
    std::shared_ptr<const Frame> depth;
    if (depth_enabled_) {
        if (!pulled.depth.has_value()) {
            throw CaptureError("Device returned no depth map");
        }
        depth = std::make_shared<const Frame>(toPublished(*pulled.depth, FrameKind::DepthMap));
    }

    // In-process readers first, other processes second.
    cell_.update(image, depth);

    if (image_buffer_ != nullptr) {
        image_buffer_->write(*image);
    }
    if (depth && depth_buffer_ != nullptr) {
        depth_buffer_->write(*depth);
    }

    ++cycles_;
}

void AcquisitionLoop::run(const StopToken& token) {
    active_.store(true);
    Logger::log(LogLevel::Debug, "Acquisition loop started.");

    try {
        while (!token.stopRequested()) {
            cycle();
            if (token.waitFor(pacing_)) {
                break;
            }
        }
    } catch (const std::exception& ex) {
        Logger::log(LogLevel::Error, std::string("Acquisition loop terminated: ") + ex.what());
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = std::current_exception();
    } catch (...) {
        Logger::log(LogLevel::Error, "Acquisition loop terminated by a non-standard exception.");
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = std::current_exception();
    }

    Logger::log(LogLevel::Debug, "Acquisition loop exited after " + std::to_string(cycles_.load()) + " cycles.");
    active_.store(false);
}

bool AcquisitionLoop::faulted() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_ != nullptr;
}

std::exception_ptr AcquisitionLoop::error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

void AcquisitionLoop::clearError() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_ = nullptr;
}

} // namespace zedframe
