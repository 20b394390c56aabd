#pragma once
// Camera abstraction for real and mock ZED cameras.

#include <sl/Camera.hpp>

namespace zedframe {

class IZedCamera {
public:
    virtual ~IZedCamera() = default;

    virtual sl::ERROR_CODE open(const sl::InitParameters& params) = 0;
    virtual void close() = 0;

    virtual sl::ERROR_CODE grab(const sl::RuntimeParameters& params) = 0;
    virtual sl::ERROR_CODE retrieveImage(sl::Mat& image, sl::VIEW view) = 0;
    virtual sl::CameraInformation getCameraInformation() = 0;
};

} // namespace zedframe
