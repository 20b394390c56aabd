#include "zedframe/CameraSensor.hpp"

#include <sstream>
#include <utility>

#include "zedframe/Errors.hpp"
#include "zedframe/Logger.hpp"

namespace zedframe {
namespace {

const SensorConfig& validated(const SensorConfig& config) {
    config.validate();
    return config;
}

FrameSource& requireSource(const std::unique_ptr<FrameSource>& source) {
    if (!source) {
        throw ConfigurationError("Camera sensor needs a frame source");
    }
    return *source;
}

} // namespace

const char* sensorStateName(SensorState state) {
    switch (state) {
        case SensorState::Stopped:
            return "stopped";
        case SensorState::Running:
            return "running";
        case SensorState::Faulted:
            return "faulted";
    }
    return "stopped";
}

StereoCameraSensor::StereoCameraSensor(const SensorConfig& config, std::unique_ptr<FrameSource> source)
    : config_(validated(config)),
      source_(std::move(source)),
      cell_(config_.include_depth),
      loop_(requireSource(source_), cell_, config_.camera_view, config_.include_depth,
            std::chrono::milliseconds(config_.pacing_ms)) {}

StereoCameraSensor::~StereoCameraSensor() {
    try {
        stop();
    } catch (const std::exception& ex) {
        Logger::log(LogLevel::Error, std::string("Error while shutting down camera sensor: ") + ex.what());
    }
}

void StereoCameraSensor::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (started_.load()) {
        if (loop_.faulted()) {
            throw ActivationError("Camera sensor faulted; call stop() before starting it again");
        }
        Logger::log(LogLevel::Info, "Camera sensor already started.");
        return;
    }

    loop_.clearError();
    stop_token_.reset();

    SourceSettings settings;
    settings.resolution = config_.resolution;
    settings.fps = config_.fps;
    settings.depth_enabled = config_.include_depth;

    const SourceInfo info = source_->open(settings);
    device_open_ = true;

    try {
        const FrameShape shape{info.height, info.width, AcquisitionLoop::kPublishedChannels};
        if (shape.bytes() == 0) {
            throw ActivationError("Camera reported an empty resolution");
        }
        published_shape_ = shape;

        image_buffer_.emplace(imageBufferPath(), shape, config_.buffer_mode);
        if (config_.include_depth) {
            depth_buffer_.emplace(depthBufferPath(), shape, config_.buffer_mode);
        }
        loop_.setSharedBuffers(image_buffer_ ? &*image_buffer_ : nullptr, depth_buffer_ ? &*depth_buffer_ : nullptr);

        // Populate the cell before returning so callers never see NotReady.
        loop_.cycle();

        worker_ = std::thread([this]() { loop_.run(stop_token_); });
    } catch (const std::exception& ex) {
        Logger::log(LogLevel::Error, std::string("Camera sensor failed to start: ") + ex.what());
        releaseDevice();
        throw;
    }

    started_.store(true);

    std::ostringstream oss;
    oss << "Camera sensor: ON (" << resolutionName(config_.resolution) << "@" << config_.fps << "fps, "
        << cameraViewName(config_.camera_view) << " view, " << published_shape_->toString()
        << (config_.include_depth ? ", depth" : "") << ")";
    Logger::log(LogLevel::Info, oss.str());
}

void StereoCameraSensor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    stop_token_.requestStop();
    if (worker_.joinable()) {
        worker_.join();
    }

    const bool was_open = device_open_;
    releaseDevice();
    started_.store(false);

    if (was_open) {
        Logger::log(LogLevel::Info, "Camera sensor: OFF");
    }
}

void StereoCameraSensor::releaseDevice() {
    loop_.setSharedBuffers(nullptr, nullptr);
    image_buffer_.reset();
    depth_buffer_.reset();
    published_shape_.reset();

    if (device_open_) {
        device_open_ = false;
        source_->close();
    }
    cell_.reset();
}

Frame StereoCameraSensor::getImageFrame() const {
    return cell_.snapshotImage();
}

Frame StereoCameraSensor::getDepthMap() const {
    return cell_.snapshotDepth();
}

SensorState StereoCameraSensor::state() const {
    if (!started_.load()) {
        return SensorState::Stopped;
    }
    return loop_.faulted() ? SensorState::Faulted : SensorState::Running;
}

std::exception_ptr StereoCameraSensor::lastError() const {
    return loop_.error();
}

void StereoCameraSensor::rethrowIfFaulted() const {
    if (const auto error = loop_.error()) {
        std::rethrow_exception(error);
    }
}

std::optional<FrameShape> StereoCameraSensor::publishedShape() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return published_shape_;
}

std::string StereoCameraSensor::imageBufferPath() const {
    return SharedFrameBuffer::pathFor(config_.buffer_dir, config_.image_buffer);
}

std::string StereoCameraSensor::depthBufferPath() const {
    return SharedFrameBuffer::pathFor(config_.buffer_dir, config_.depth_buffer);
}

Frame StereoCameraSensor::readShared(const std::string& name, const FrameShape& shape, const std::string& directory,
                                     BufferMode mode, FrameKind kind) {
    return SharedFrameBuffer::readFrame(SharedFrameBuffer::pathFor(directory, name), shape, kind, mode);
}

} // namespace zedframe
