#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "zedframe/CameraSensor.hpp"
#include "zedframe/Errors.hpp"
#include "zedframe/Logger.hpp"
#include "zedframe/RealZedCamera.hpp"
#include "zedframe/SensorConfig.hpp"
#include "zedframe/ZedFrameSource.hpp"

namespace zedframe {
namespace {

volatile std::sig_atomic_t g_running = 1;

void handleSignal(int) {
    g_running = 0;
}

int parseIntArg(int argc, char** argv, const std::string& prefix, int fallback) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind(prefix, 0) == 0) {
            return std::stoi(arg.substr(prefix.size()));
        }
    }
    return fallback;
}

SensorConfig loadConfig(int argc, char** argv) {
    const ConfigOverrides overrides = ConfigOverrides::fromArgs(argc, argv);
    SensorConfig config;
    if (overrides.config_path.has_value()) {
        config = SensorConfig::fromFile(*overrides.config_path);
    }
    config.applyOverrides(overrides);
    return config;
}

} // namespace
} // namespace zedframe

int main(int argc, char** argv) {
    using namespace zedframe;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    SensorConfig config;
    int iterations = 0;
    int status_ms = 1000;
    try {
        config = loadConfig(argc, argv);
        // --iterations counts status reports, one per --status-ms.
        iterations = parseIntArg(argc, argv, "--iterations=", 0);
        status_ms = parseIntArg(argc, argv, "--status-ms=", 1000);
    } catch (const std::exception& ex) {
        Logger::log(LogLevel::Error, ex.what());
        return 2;
    }
    Logger::setMinLevel(config.log_level);

    std::unique_ptr<StereoCameraSensor> sensor;
    try {
        sensor = std::make_unique<StereoCameraSensor>(
            config, std::make_unique<ZedFrameSource>(std::make_unique<RealZedCamera>()));
        sensor->start();
    } catch (const SensorError& ex) {
        Logger::log(LogLevel::Error, ex.what());
        return 1;
    }

    Logger::log(LogLevel::Info, "Publishing " + sensor->imageBufferPath() +
                                    (config.include_depth ? " and " + sensor->depthBufferPath() : std::string()) +
                                    " as " + sensor->publishedShape()->toString() + " (" +
                                    bufferModeName(config.buffer_mode) + ").");

    int exit_code = 0;
    int count = 0;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(status_ms));

        if (sensor->state() == SensorState::Faulted) {
            try {
                sensor->rethrowIfFaulted();
            } catch (const std::exception& ex) {
                Logger::log(LogLevel::Error, std::string("Capture stopped: ") + ex.what());
            }
            exit_code = 1;
            break;
        }

        std::ostringstream oss;
        oss << "Captured " << sensor->cycles() << " frames.";
        Logger::log(LogLevel::Debug, oss.str());

        if (iterations > 0 && ++count >= iterations) {
            break;
        }
    }

    sensor->stop();
    return exit_code;
}
