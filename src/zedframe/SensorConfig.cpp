#include "zedframe/SensorConfig.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "zedframe/Errors.hpp"

namespace zedframe {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

int parseInt(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid integer for " + key + ": " + value);
    }
}

// Unlike Node::as<T>(fallback), a present but unconvertible value throws.
template <typename T>
T valueOr(const YAML::Node& root, const std::string& key, const T& fallback) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<T>();
}

std::string argValue(const std::string& arg, const std::string& prefix) {
    return arg.substr(prefix.size());
}

} // namespace

const std::map<Resolution, std::vector<int>>& compatibilityTable() {
    static const std::map<Resolution, std::vector<int>> table = {
        {Resolution::HD720, {15, 30, 60}},
        {Resolution::HD1080, {15, 30}},
        {Resolution::HD2K, {15}},
    };
    return table;
}

bool isSupported(Resolution resolution, int fps) {
    const auto& table = compatibilityTable();
    const auto it = table.find(resolution);
    if (it == table.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), fps) != it->second.end();
}

Resolution parseResolution(const std::string& value) {
    const auto lower = toLower(trim(value));
    if (lower == "720") {
        return Resolution::HD720;
    }
    if (lower == "1080") {
        return Resolution::HD1080;
    }
    if (lower == "2k") {
        return Resolution::HD2K;
    }
    throw ConfigurationError("Incorrect resolution: " + value);
}

CameraView parseCameraView(const std::string& value) {
    const auto lower = toLower(trim(value));
    if (lower == "left") {
        return CameraView::Left;
    }
    if (lower == "right") {
        return CameraView::Right;
    }
    throw ConfigurationError("Incorrect camera view: " + value);
}

BufferMode parseBufferMode(const std::string& value) {
    const auto lower = toLower(trim(value));
    if (lower == "plain") {
        return BufferMode::Plain;
    }
    if (lower == "sequenced" || lower == "seqlock") {
        return BufferMode::Sequenced;
    }
    throw ConfigurationError("Unknown buffer mode: " + value);
}

std::string resolutionName(Resolution resolution) {
    switch (resolution) {
        case Resolution::HD720:
            return "720";
        case Resolution::HD1080:
            return "1080";
        case Resolution::HD2K:
            return "2K";
    }
    return "unknown";
}

std::string cameraViewName(CameraView view) {
    return view == CameraView::Left ? "left" : "right";
}

std::string bufferModeName(BufferMode mode) {
    return mode == BufferMode::Plain ? "plain" : "sequenced";
}

FrameShape nominalShape(Resolution resolution) {
    switch (resolution) {
        case Resolution::HD720:
            return FrameShape{720, 1280, 3};
        case Resolution::HD1080:
            return FrameShape{1080, 1920, 3};
        case Resolution::HD2K:
            return FrameShape{1242, 2208, 3};
    }
    return FrameShape{};
}

void SensorConfig::validate() const {
    if (camera_view != CameraView::Left && camera_view != CameraView::Right) {
        throw ConfigurationError("Incorrect camera view");
    }

    const auto& table = compatibilityTable();
    const auto it = table.find(resolution);
    if (it == table.end()) {
        throw ConfigurationError("Incorrect resolution");
    }
    if (!isSupported(resolution, fps)) {
        std::ostringstream oss;
        oss << "Invalid FPS " << fps << " for resolution " << resolutionName(resolution) << " (allowed:";
        for (const int allowed : it->second) {
            oss << " " << allowed;
        }
        oss << ")";
        throw ConfigurationError(oss.str());
    }

    if (pacing_ms < 0) {
        throw ConfigurationError("pacing_ms must not be negative");
    }
    if (image_buffer.empty() || (include_depth && depth_buffer.empty())) {
        throw ConfigurationError("Shared buffer names must not be empty");
    }
    if (image_buffer == depth_buffer) {
        throw ConfigurationError("Image and depth buffers must have different names");
    }
}

SensorConfig SensorConfig::fromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("Failed to open config file: " + path);
    } catch (const YAML::ParserException& ex) {
        throw ConfigurationError("Failed to parse config file " + path + ": " + ex.what());
    }

    SensorConfig config;
    try {
        config.resolution = parseResolution(valueOr<std::string>(root, "camera_resolution", resolutionName(config.resolution)));
        config.fps = valueOr<int>(root, "fps", config.fps);
        config.camera_view = parseCameraView(valueOr<std::string>(root, "camera_view", cameraViewName(config.camera_view)));
        config.include_depth = valueOr<bool>(root, "include_depth", config.include_depth);
        config.pacing_ms = valueOr<int>(root, "pacing_ms", config.pacing_ms);
        config.buffer_dir = valueOr<std::string>(root, "buffer_dir", config.buffer_dir);
        config.image_buffer = valueOr<std::string>(root, "image_buffer", config.image_buffer);
        config.depth_buffer = valueOr<std::string>(root, "depth_buffer", config.depth_buffer);
        config.buffer_mode = parseBufferMode(valueOr<std::string>(root, "buffer_mode", bufferModeName(config.buffer_mode)));
        const auto level = valueOr<std::string>(root, "log_level", "");
        if (!level.empty()) {
            config.log_level = parseLogLevel(level);
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Invalid value in config file " + path + ": " + ex.what());
    }

    return config;
}

ConfigOverrides ConfigOverrides::fromArgs(int argc, char** argv) {
    ConfigOverrides overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            overrides.config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            overrides.config_path = argValue(arg, "--config=");
        } else if (arg.rfind("--resolution=", 0) == 0) {
            overrides.resolution = parseResolution(argValue(arg, "--resolution="));
        } else if (arg.rfind("--fps=", 0) == 0) {
            overrides.fps = parseInt("fps", argValue(arg, "--fps="));
        } else if (arg.rfind("--view=", 0) == 0) {
            overrides.camera_view = parseCameraView(argValue(arg, "--view="));
        } else if (arg == "--depth") {
            overrides.include_depth = true;
        } else if (arg == "--no-depth") {
            overrides.include_depth = false;
        } else if (arg.rfind("--pacing-ms=", 0) == 0) {
            overrides.pacing_ms = parseInt("pacing_ms", argValue(arg, "--pacing-ms="));
        } else if (arg.rfind("--buffer-dir=", 0) == 0) {
            overrides.buffer_dir = argValue(arg, "--buffer-dir=");
        } else if (arg.rfind("--buffer-mode=", 0) == 0) {
            overrides.buffer_mode = parseBufferMode(argValue(arg, "--buffer-mode="));
        } else if (arg.rfind("--log-level=", 0) == 0) {
            overrides.log_level = parseLogLevel(argValue(arg, "--log-level="));
        }
    }

    return overrides;
}

void SensorConfig::applyOverrides(const ConfigOverrides& overrides) {
    if (overrides.resolution.has_value()) {
        resolution = *overrides.resolution;
    }
    if (overrides.fps.has_value()) {
        fps = *overrides.fps;
    }
    if (overrides.camera_view.has_value()) {
        camera_view = *overrides.camera_view;
    }
    if (overrides.include_depth.has_value()) {
        include_depth = *overrides.include_depth;
    }
    if (overrides.pacing_ms.has_value()) {
        pacing_ms = *overrides.pacing_ms;
    }
    if (overrides.buffer_dir.has_value()) {
        buffer_dir = *overrides.buffer_dir;
    }
    if (overrides.buffer_mode.has_value()) {
        buffer_mode = *overrides.buffer_mode;
    }
    if (overrides.log_level.has_value()) {
        log_level = *overrides.log_level;
    }
}

} // namespace zedframe
