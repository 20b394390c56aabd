#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "MockFrameSource.hpp"
#include "TestPaths.hpp"
#include "zedframe/CameraSensor.hpp"
#include "zedframe/Errors.hpp"

namespace zedframe {
namespace {

SensorConfig testConfig(const ScratchDir& dir, bool include_depth = true) {
    SensorConfig config;
    config.resolution = Resolution::HD720;
    config.fps = 60;
    config.include_depth = include_depth;
    config.pacing_ms = 1;
    config.buffer_dir = dir.str();
    return config;
}

template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

class CountingSource : public MockFrameSource {
public:
    explicit CountingSource(std::atomic<int>& closes) : closes_(closes) {}

    void close() override {
        MockFrameSource::close();
        ++closes_;
    }

private:
    std::atomic<int>& closes_;
};

} // namespace

TEST(SensorLifecycleTest, FrameAvailableImmediatelyAfterStart) {
    ScratchDir dir;
    auto source = std::make_unique<MockFrameSource>();
    auto* mock = source.get();
    StereoCameraSensor sensor(testConfig(dir), std::move(source));

    EXPECT_EQ(sensor.state(), SensorState::Stopped);
    EXPECT_THROW(sensor.getImageFrame(), NotReadyError);

    sensor.start();
    EXPECT_EQ(sensor.state(), SensorState::Running);
    EXPECT_NO_THROW(sensor.getImageFrame());
    EXPECT_NO_THROW(sensor.getDepthMap());
    EXPECT_EQ(sensor.getImageFrame().channels, 3);
    EXPECT_EQ(mock->last_settings.resolution, Resolution::HD720);
    EXPECT_EQ(mock->last_settings.fps, 60);
    EXPECT_TRUE(mock->last_settings.depth_enabled);

    sensor.stop();
    EXPECT_EQ(sensor.state(), SensorState::Stopped);
}

TEST(SensorLifecycleTest, PublishesBothNamedBuffers) {
    ScratchDir dir;
    StereoCameraSensor sensor(testConfig(dir), std::make_unique<MockFrameSource>(8, 4));
    sensor.start();

    ASSERT_TRUE(sensor.publishedShape().has_value());
    const auto shape = *sensor.publishedShape();
    EXPECT_EQ(shape, (FrameShape{4, 8, 3}));

    const auto image = StereoCameraSensor::readShared("zed_image", shape, dir.str());
    const auto depth = StereoCameraSensor::readShared("zed_depth_map", shape, dir.str(), BufferMode::Plain,
                                                      FrameKind::DepthMap);
    EXPECT_EQ(image.shape(), shape);
    EXPECT_EQ(depth.kind, FrameKind::DepthMap);
    EXPECT_EQ(depth.shape(), shape);

    sensor.stop();

    // Regions outlive the sensor.
    EXPECT_NO_THROW(StereoCameraSensor::readShared("zed_image", shape, dir.str()));
}

TEST(SensorLifecycleTest, SequencedBuffersCarryIncreasingSequence) {
    ScratchDir dir;
    auto config = testConfig(dir, false);
    config.buffer_mode = BufferMode::Sequenced;
    StereoCameraSensor sensor(config, std::make_unique<MockFrameSource>(8, 4));
    sensor.start();

    const auto shape = *sensor.publishedShape();
    std::uint64_t first = 0;
    SharedFrameBuffer::read(sensor.imageBufferPath(), shape, BufferMode::Sequenced, &first);
    ASSERT_TRUE(waitUntil([&]() {
        std::uint64_t later = 0;
        SharedFrameBuffer::read(sensor.imageBufferPath(), shape, BufferMode::Sequenced, &later);
        return later > first;
    }));
    sensor.stop();
}

TEST(SensorLifecycleTest, SecondStartDoesNotSpawnSecondWorker) {
    ScratchDir dir;
    auto source = std::make_unique<MockFrameSource>();
    auto* mock = source.get();
    StereoCameraSensor sensor(testConfig(dir), std::move(source));

    sensor.start();
    sensor.start();
    ASSERT_TRUE(waitUntil([&]() { return mock->pull_calls.load() > 10; }));
    sensor.stop();

    EXPECT_EQ(mock->open_calls.load(), 1);
    EXPECT_EQ(mock->close_calls.load(), 1);
    // The synchronous first pull runs on the caller, everything else on one worker.
    EXPECT_EQ(mock->pullThreadCount(), 2u);
}

TEST(SensorLifecycleTest, StopIsIdempotentAndSafeWithoutStart) {
    ScratchDir dir;
    auto source = std::make_unique<MockFrameSource>();
    auto* mock = source.get();
    StereoCameraSensor sensor(testConfig(dir), std::move(source));

    sensor.stop();
    EXPECT_EQ(mock->close_calls.load(), 0);

    sensor.start();
    sensor.stop();
    sensor.stop();
    EXPECT_EQ(mock->close_calls.load(), 1);
    EXPECT_FALSE(mock->opened.load());
    EXPECT_THROW(sensor.getImageFrame(), NotReadyError);
}

TEST(SensorLifecycleTest, RestartAfterStop) {
    ScratchDir dir;
    auto source = std::make_unique<MockFrameSource>();
    auto* mock = source.get();
    StereoCameraSensor sensor(testConfig(dir), std::move(source));

    sensor.start();
    sensor.stop();
    sensor.start();
    EXPECT_EQ(sensor.state(), SensorState::Running);
    EXPECT_NO_THROW(sensor.getImageFrame());
    sensor.stop();

    EXPECT_EQ(mock->open_calls.load(), 2);
    EXPECT_EQ(mock->close_calls.load(), 2);
}

TEST(SensorLifecycleTest, ActivationFailureLeavesSensorStopped) {
    ScratchDir dir;
    auto source = std::make_unique<MockFrameSource>();
    source->fail_open = true;
    auto* mock = source.get();
    StereoCameraSensor sensor(testConfig(dir), std::move(source));

    EXPECT_THROW(sensor.start(), ActivationError);
    EXPECT_EQ(sensor.state(), SensorState::Stopped);
    EXPECT_EQ(mock->pull_calls.load(), 0);
    EXPECT_NO_THROW(sensor.stop());
    EXPECT_EQ(mock->close_calls.load(), 0);
}

TEST(SensorLifecycleTest, InitialCaptureFailureClosesDevice) {
    ScratchDir dir;
    auto source = std::make_unique<MockFrameSource>();
    source->fail_on_pull = 1;
    auto* mock = source.get();
    StereoCameraSensor sensor(testConfig(dir), std::move(source));

    EXPECT_THROW(sensor.start(), CaptureError);
    EXPECT_EQ(sensor.state(), SensorState::Stopped);
    EXPECT_EQ(mock->close_calls.load(), 1);
    EXPECT_FALSE(mock->opened.load());
}

TEST(SensorLifecycleTest, CaptureFailureOnThirdPullKeepsSecondFrame) {
    ScratchDir dir;
    auto source = std::make_unique<MockFrameSource>();
    source->fail_on_pull = 3;
    auto* mock = source.get();
    StereoCameraSensor sensor(testConfig(dir), std::move(source));

    sensor.start();
    ASSERT_TRUE(waitUntil([&]() { return sensor.state() == SensorState::Faulted; }));

    EXPECT_EQ(sensor.cycles(), 2u);
    EXPECT_EQ(mock->pull_calls.load(), 3);
    EXPECT_EQ(sensor.getImageFrame().data.front(), 2);
    EXPECT_EQ(sensor.getDepthMap().data.front(), 102);
    EXPECT_THROW(sensor.rethrowIfFaulted(), CaptureError);

    // The device stays held until stop().
    EXPECT_TRUE(mock->opened.load());
    EXPECT_THROW(sensor.start(), ActivationError);

    sensor.stop();
    EXPECT_EQ(sensor.state(), SensorState::Stopped);
    EXPECT_FALSE(mock->opened.load());
    EXPECT_EQ(mock->close_calls.load(), 1);
}

TEST(SensorLifecycleTest, DepthMapUnavailableWhenDisabled) {
    ScratchDir dir;
    StereoCameraSensor sensor(testConfig(dir, false), std::make_unique<MockFrameSource>());
    sensor.start();
    EXPECT_NO_THROW(sensor.getImageFrame());
    EXPECT_THROW(sensor.getDepthMap(), NotAvailableError);
    sensor.stop();
}

TEST(SensorLifecycleTest, ConcurrentReadersDuringCapture) {
    ScratchDir dir;
    StereoCameraSensor sensor(testConfig(dir), std::make_unique<MockFrameSource>(64, 48));
    sensor.start();

    std::atomic<int> torn{0};
    auto reader = [&]() {
        for (int i = 0; i < 500; ++i) {
            const auto frame = sensor.getImageFrame();
            const bool uniform = std::all_of(frame.data.begin(), frame.data.end(),
                                             [&](std::uint8_t byte) { return byte == frame.data.front(); });
            if (!uniform) {
                ++torn;
            }
        }
    };
    std::thread first(reader);
    std::thread second(reader);
    first.join();
    second.join();
    sensor.stop();

    EXPECT_EQ(torn.load(), 0);
}

TEST(SensorLifecycleTest, DestructorStopsRunningSensor) {
    ScratchDir dir;
    std::atomic<int> closes{0};
    {
        StereoCameraSensor sensor(testConfig(dir), std::make_unique<CountingSource>(closes));
        sensor.start();
    }
    EXPECT_EQ(closes.load(), 1);
}

} // namespace zedframe
