#pragma once
// Sensor configuration, the resolution/fps compatibility table and overrides.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "zedframe/Frame.hpp"
#include "zedframe/Logger.hpp"

namespace zedframe {

enum class Resolution {
    HD720,
    HD1080,
    HD2K
};

enum class CameraView {
    Left,
    Right
};

enum class BufferMode {
    Plain,     // bytes only, no synchronization
    Sequenced  // 64-byte seqlock header in front of the bytes
};

// Resolution -> allowed fps. Immutable for the life of the process.
const std::map<Resolution, std::vector<int>>& compatibilityTable();

bool isSupported(Resolution resolution, int fps);

// Accepts "720", "1080" and "2K" (case-insensitive).
Resolution parseResolution(const std::string& value);
CameraView parseCameraView(const std::string& value);
BufferMode parseBufferMode(const std::string& value);

std::string resolutionName(Resolution resolution);
std::string cameraViewName(CameraView view);
std::string bufferModeName(BufferMode mode);

// Nominal sensor size for a resolution, with the 3 channels published downstream.
FrameShape nominalShape(Resolution resolution);

struct ConfigOverrides {
    std::optional<Resolution> resolution;
    std::optional<int> fps;
    std::optional<CameraView> camera_view;
    std::optional<bool> include_depth;
    std::optional<int> pacing_ms;
    std::optional<std::string> buffer_dir;
    std::optional<BufferMode> buffer_mode;
    std::optional<LogLevel> log_level;
    std::optional<std::string> config_path;

    static ConfigOverrides fromArgs(int argc, char** argv);
};

struct SensorConfig {
    Resolution resolution = Resolution::HD1080;
    int fps = 30;
    CameraView camera_view = CameraView::Left;
    bool include_depth = true;

    int pacing_ms = 60;

    std::string buffer_dir = ".";
    std::string image_buffer = "zed_image";
    std::string depth_buffer = "zed_depth_map";
    BufferMode buffer_mode = BufferMode::Plain;

    LogLevel log_level = LogLevel::Info;

    // Throws ConfigurationError on an unsupported combination.
    void validate() const;

    // Loads a YAML file on top of the defaults. Missing keys keep defaults.
    static SensorConfig fromFile(const std::string& path);

    void applyOverrides(const ConfigOverrides& overrides);
};

} // namespace zedframe
