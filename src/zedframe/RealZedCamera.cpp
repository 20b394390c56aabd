#include "zedframe/RealZedCamera.hpp"

namespace zedframe {

RealZedCamera::~RealZedCamera() {
    close();
}

sl::ERROR_CODE RealZedCamera::open(const sl::InitParameters& params) {
    return camera_.open(params);
}

void RealZedCamera::close() {
    if (camera_.isOpened()) {
        camera_.close();
    }
}

sl::ERROR_CODE RealZedCamera::grab(const sl::RuntimeParameters& params) {
    return camera_.grab(params);
}

sl::ERROR_CODE RealZedCamera::retrieveImage(sl::Mat& image, sl::VIEW view) {
    return camera_.retrieveImage(image, view, sl::MEM::CPU);
}

sl::CameraInformation RealZedCamera::getCameraInformation() {
    return camera_.getCameraInformation();
}

} // namespace zedframe
