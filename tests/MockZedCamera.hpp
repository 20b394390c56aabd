#pragma once

#include <vector>

#include <sl/Camera.hpp>

#include "zedframe/IZedCamera.hpp"

namespace zedframe {

class MockZedCamera : public IZedCamera {
public:
    sl::ERROR_CODE open(const sl::InitParameters& params) override {
        last_init_params = params;
        opened = open_result == sl::ERROR_CODE::SUCCESS;
        return open_result;
    }

    void close() override {
        opened = false;
        ++close_calls;
    }

    sl::ERROR_CODE grab(const sl::RuntimeParameters&) override { return grab_result; }

    sl::ERROR_CODE retrieveImage(sl::Mat& image, sl::VIEW view) override {
        last_views.push_back(view);
        if (image_result != sl::ERROR_CODE::SUCCESS) {
            return image_result;
        }
        image.alloc(width, height, sl::MAT_TYPE::U8_C4, sl::MEM::CPU);
        const sl::uchar1 value = view == sl::VIEW::DEPTH ? depth_value : image_value;
        image.setTo(sl::uchar4(value, value, value, 255), sl::MEM::CPU);
        return sl::ERROR_CODE::SUCCESS;
    }

    sl::CameraInformation getCameraInformation() override {
        sl::CameraInformation info;
        info.camera_configuration.resolution = sl::Resolution(width, height);
        return info;
    }

    bool opened = false;
    int close_calls = 0;
    sl::InitParameters last_init_params{};
    std::vector<sl::VIEW> last_views;

    int width = 16;
    int height = 8;
    sl::uchar1 image_value = 40;
    sl::uchar1 depth_value = 200;

    sl::ERROR_CODE open_result = sl::ERROR_CODE::SUCCESS;
    sl::ERROR_CODE grab_result = sl::ERROR_CODE::SUCCESS;
    sl::ERROR_CODE image_result = sl::ERROR_CODE::SUCCESS;
};

} // namespace zedframe
