#pragma once
// RAII wrapper over sl::Camera.

#include "zedframe/IZedCamera.hpp"

namespace zedframe {

class RealZedCamera : public IZedCamera {
public:
    RealZedCamera() = default;
    ~RealZedCamera() override;

    sl::ERROR_CODE open(const sl::InitParameters& params) override;
    void close() override;

    sl::ERROR_CODE grab(const sl::RuntimeParameters& params) override;
    sl::ERROR_CODE retrieveImage(sl::Mat& image, sl::VIEW view) override;
    sl::CameraInformation getCameraInformation() override;

private:
    sl::Camera camera_;
};

} // namespace zedframe
