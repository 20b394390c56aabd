#pragma once
// Device abstraction for real and simulated stereo cameras.

#include <optional>

#include "zedframe/Frame.hpp"
#include "zedframe/SensorConfig.hpp"

namespace zedframe {

struct SourceSettings {
    Resolution resolution = Resolution::HD1080;
    int fps = 30;
    bool depth_enabled = true;
};

// What the device reports once open.
struct SourceInfo {
    int width = 0;
    int height = 0;
};

struct PulledFrames {
    Frame image;                // as delivered by the device, alpha included
    std::optional<Frame> depth; // set only when depth is enabled
};

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Throws ActivationError.
    virtual SourceInfo open(const SourceSettings& settings) = 0;
    // Blocks until the device delivers the next sample. Throws CaptureError.
    virtual PulledFrames pull(CameraView view) = 0;
    virtual void close() = 0;
};

} // namespace zedframe
