#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "TestPaths.hpp"
#include "zedframe/CameraSensor.hpp"
#include "zedframe/Errors.hpp"
#include "zedframe/RealZedCamera.hpp"
#include "zedframe/ZedFrameSource.hpp"

namespace zedframe {

TEST(IntegrationLiveTest, CapturesAndPublishesWithLiveCamera) {
    // End-to-end capture and cross-process publish from a live camera.
    if (std::getenv("ZED_TEST_LIVE") == nullptr) {
        GTEST_SKIP() << "ZED_TEST_LIVE not set";
    }

    ScratchDir dir;
    SensorConfig config;
    config.resolution = Resolution::HD720;
    config.fps = 30;
    config.include_depth = true;
    config.buffer_dir = dir.str();

    StereoCameraSensor sensor(config, std::make_unique<ZedFrameSource>(std::make_unique<RealZedCamera>()));
    try {
        sensor.start();
    } catch (const ActivationError& ex) {
        GTEST_SKIP() << "Camera not available: " << ex.what();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_EQ(sensor.state(), SensorState::Running);

    const auto image = sensor.getImageFrame();
    const auto depth = sensor.getDepthMap();
    EXPECT_EQ(image.channels, 3);
    EXPECT_EQ(depth.shape(), image.shape());

    const auto shared = StereoCameraSensor::readShared(config.image_buffer, image.shape(), dir.str());
    EXPECT_EQ(shared.sizeBytes(), image.sizeBytes());

    sensor.stop();
}

} // namespace zedframe
