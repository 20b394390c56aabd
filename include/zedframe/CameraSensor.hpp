#pragma once
// Camera sensor lifecycle: start/stop of the device and its acquisition worker.

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "zedframe/AcquisitionLoop.hpp"
#include "zedframe/Frame.hpp"
#include "zedframe/FrameSource.hpp"
#include "zedframe/FrameStateCell.hpp"
#include "zedframe/SensorConfig.hpp"
#include "zedframe/SharedFrameBuffer.hpp"
#include "zedframe/StopToken.hpp"

namespace zedframe {

enum class SensorState {
    Stopped,
    Running,
    Faulted // worker exited on an error; stop() must release the device
};

const char* sensorStateName(SensorState state);

class CameraSensor {
public:
    virtual ~CameraSensor() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual Frame getImageFrame() const = 0;
};

class StereoCameraSensor : public CameraSensor {
public:
    // Throws ConfigurationError for an unsupported view/resolution/fps.
    StereoCameraSensor(const SensorConfig& config, std::unique_ptr<FrameSource> source);
    ~StereoCameraSensor() override;

    StereoCameraSensor(const StereoCameraSensor&) = delete;
    StereoCameraSensor& operator=(const StereoCameraSensor&) = delete;

    // Opens the device, captures one frame synchronously and spawns the
    // acquisition worker. A no-op if already running.
    // Throws ActivationError or CaptureError; the sensor stays stopped.
    void start() override;

    // Stops and joins the worker, then closes the device. Idempotent.
    void stop() override;

    // Copies of the latest frames. Throw NotReadyError / NotAvailableError.
    Frame getImageFrame() const override;
    Frame getDepthMap() const;

    SensorState state() const;
    std::exception_ptr lastError() const;
    void rethrowIfFaulted() const;

    const SensorConfig& config() const { return config_; }
    // Shape of the published frames; known once started.
    std::optional<FrameShape> publishedShape() const;
    std::uint64_t cycles() const { return loop_.cycles(); }

    std::string imageBufferPath() const;
    std::string depthBufferPath() const;

    // Cross-process side: reads a named buffer written by a running sensor.
    static Frame readShared(const std::string& name, const FrameShape& shape, const std::string& directory = ".",
                            BufferMode mode = BufferMode::Plain, FrameKind kind = FrameKind::Image);

private:
    void releaseDevice();

    const SensorConfig config_;
    std::unique_ptr<FrameSource> source_;
    FrameStateCell cell_;
    AcquisitionLoop loop_;
    StopToken stop_token_;
    std::thread worker_;

    std::optional<SharedFrameBuffer> image_buffer_;
    std::optional<SharedFrameBuffer> depth_buffer_;
    std::optional<FrameShape> published_shape_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> started_{false};
    bool device_open_ = false;
};

} // namespace zedframe
