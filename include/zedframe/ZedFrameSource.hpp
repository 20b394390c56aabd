#pragma once
// FrameSource backed by the ZED SDK.

#include <memory>

#include <sl/Camera.hpp>

#include "zedframe/FrameSource.hpp"
#include "zedframe/IZedCamera.hpp"

namespace zedframe {

class ZedFrameSource : public FrameSource {
public:
    explicit ZedFrameSource(std::unique_ptr<IZedCamera> camera);
    ~ZedFrameSource() override;

    SourceInfo open(const SourceSettings& settings) override;
    PulledFrames pull(CameraView view) override;
    void close() override;

    static sl::InitParameters makeInitParameters(const SourceSettings& settings);

private:
    Frame copyMat(const sl::Mat& mat, FrameKind kind) const;

    std::unique_ptr<IZedCamera> camera_;
    sl::RuntimeParameters runtime_params_{};
    sl::Mat image_{};
    sl::Mat depth_{};
    bool depth_enabled_ = false;
    bool opened_ = false;
};

} // namespace zedframe
