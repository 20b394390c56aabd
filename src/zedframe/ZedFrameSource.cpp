#include "zedframe/ZedFrameSource.hpp"

#include <cstring>
#include <sstream>
#include <utility>

#include "zedframe/Errors.hpp"
#include "zedframe/Logger.hpp"

namespace zedframe {
namespace {

sl::RESOLUTION toSdkResolution(Resolution resolution) {
    switch (resolution) {
        case Resolution::HD720:
            return sl::RESOLUTION::HD720;
        case Resolution::HD1080:
            return sl::RESOLUTION::HD1080;
        case Resolution::HD2K:
            return sl::RESOLUTION::HD2K;
    }
    return sl::RESOLUTION::HD1080;
}

sl::VIEW toSdkView(CameraView view) {
    return view == CameraView::Left ? sl::VIEW::LEFT : sl::VIEW::RIGHT;
}

std::string describe(const std::string& what, sl::ERROR_CODE code) {
    std::ostringstream oss;
    oss << what << ": " << sl::toString(code).c_str() << " (error code " << static_cast<int>(code) << ")";
    return oss.str();
}

} // namespace

ZedFrameSource::ZedFrameSource(std::unique_ptr<IZedCamera> camera) : camera_(std::move(camera)) {
    if (!camera_) {
        throw ConfigurationError("ZedFrameSource needs a camera");
    }
}

ZedFrameSource::~ZedFrameSource() {
    close();
}

sl::InitParameters ZedFrameSource::makeInitParameters(const SourceSettings& settings) {
    sl::InitParameters init_params;
    init_params.camera_resolution = toSdkResolution(settings.resolution);
    init_params.camera_fps = settings.fps;
    if (settings.depth_enabled) {
        init_params.depth_mode = sl::DEPTH_MODE::ULTRA;
        init_params.coordinate_units = sl::UNIT::MILLIMETER;
    } else {
        init_params.depth_mode = sl::DEPTH_MODE::NONE;
    }
    return init_params;
}

SourceInfo ZedFrameSource::open(const SourceSettings& settings) {
    const auto open_status = camera_->open(makeInitParameters(settings));
    if (open_status != sl::ERROR_CODE::SUCCESS) {
        const auto message = describe("Failed to open ZED camera", open_status);
        Logger::log(LogLevel::Error, message + ". Try unplugging and replugging the camera.");
        throw ActivationError(message);
    }
    opened_ = true;
    depth_enabled_ = settings.depth_enabled;

    const auto info = camera_->getCameraInformation();
    SourceInfo source_info;
    source_info.width = static_cast<int>(info.camera_configuration.resolution.width);
    source_info.height = static_cast<int>(info.camera_configuration.resolution.height);

    std::ostringstream oss;
    oss << "ZED camera opened at " << source_info.width << "x" << source_info.height << " @ " << settings.fps
        << " fps.";
    Logger::log(LogLevel::Info, oss.str());
    return source_info;
}

PulledFrames ZedFrameSource::pull(CameraView view) {
    if (!opened_) {
        throw CaptureError("ZED camera is not open");
    }

    const auto grab_status = camera_->grab(runtime_params_);
    if (grab_status != sl::ERROR_CODE::SUCCESS) {
        throw CaptureError(describe("Camera failed to return an image", grab_status));
    }

    const auto image_status = camera_->retrieveImage(image_, toSdkView(view));
    if (image_status != sl::ERROR_CODE::SUCCESS) {
        throw CaptureError(describe("Failed to retrieve image", image_status));
    }

    PulledFrames pulled;
    pulled.image = copyMat(image_, FrameKind::Image);

    if (depth_enabled_) {
        const auto depth_status = camera_->retrieveImage(depth_, sl::VIEW::DEPTH);
        if (depth_status != sl::ERROR_CODE::SUCCESS) {
            throw CaptureError(describe("Failed to retrieve depth view", depth_status));
        }
        pulled.depth = copyMat(depth_, FrameKind::DepthMap);
    }

    return pulled;
}

void ZedFrameSource::close() {
    if (opened_) {
        camera_->close();
        opened_ = false;
        Logger::log(LogLevel::Debug, "ZED camera closed.");
    }
}

Frame ZedFrameSource::copyMat(const sl::Mat& mat, FrameKind kind) const {
    const int width = static_cast<int>(mat.getWidth());
    const int height = static_cast<int>(mat.getHeight());
    const int channels = mat.getChannels();
    if (width <= 0 || height <= 0 || channels <= 0) {
        throw CaptureError("ZED returned an empty " + std::string(frameKindName(kind)));
    }
    if (mat.getPixelBytes() != static_cast<std::size_t>(channels)) {
        throw CaptureError("ZED returned a non 8-bit " + std::string(frameKindName(kind)));
    }

    Frame frame(kind, width, height, channels);
    const std::size_t step = mat.getStepBytes(sl::MEM::CPU);
    const sl::uchar1* src = mat.getPtr<sl::uchar1>(sl::MEM::CPU);
    for (int y = 0; y < height; ++y) {
        std::memcpy(frame.ptr(y), src + static_cast<std::size_t>(y) * step, frame.rowBytes());
    }
    return frame;
}

} // namespace zedframe
