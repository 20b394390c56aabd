// Reads a frame published by zedframe_capture from another process.

#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "zedframe/Errors.hpp"
#include "zedframe/Frame.hpp"
#include "zedframe/Logger.hpp"
#include "zedframe/SensorConfig.hpp"
#include "zedframe/SharedFrameBuffer.hpp"

namespace zedframe {
namespace {

volatile std::sig_atomic_t g_running = 1;

void handleSignal(int) {
    g_running = 0;
}

struct ReaderOptions {
    std::string name = "zed_image";
    std::optional<FrameShape> shape;
    int iterations = 1;
    int interval_ms = 100;
};

ReaderOptions parseReaderOptions(int argc, char** argv) {
    ReaderOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--name=", 0) == 0) {
            options.name = arg.substr(std::string("--name=").size());
        } else if (arg.rfind("--shape=", 0) == 0) {
            options.shape = FrameShape::parse(arg.substr(std::string("--shape=").size()));
        } else if (arg.rfind("--iterations=", 0) == 0) {
            options.iterations = std::stoi(arg.substr(std::string("--iterations=").size()));
        } else if (arg.rfind("--interval-ms=", 0) == 0) {
            options.interval_ms = std::stoi(arg.substr(std::string("--interval-ms=").size()));
        }
    }
    return options;
}

std::string summarize(const std::vector<std::uint8_t>& bytes, const FrameShape& shape, BufferMode mode,
                      std::uint64_t sequence) {
    const auto total = std::accumulate(bytes.begin(), bytes.end(), std::uint64_t{0});
    const double mean = bytes.empty() ? 0.0 : static_cast<double>(total) / static_cast<double>(bytes.size());

    std::ostringstream oss;
    oss << shape.toString() << " mean=" << std::fixed << std::setprecision(2) << mean;
    if (mode == BufferMode::Sequenced) {
        oss << " seq=" << sequence;
    }
    return oss.str();
}

} // namespace
} // namespace zedframe

int main(int argc, char** argv) {
    using namespace zedframe;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    SensorConfig config;
    ReaderOptions options;
    try {
        const ConfigOverrides overrides = ConfigOverrides::fromArgs(argc, argv);
        if (overrides.config_path.has_value()) {
            config = SensorConfig::fromFile(*overrides.config_path);
        }
        config.applyOverrides(overrides);
        options = parseReaderOptions(argc, argv);
    } catch (const std::exception& ex) {
        Logger::log(LogLevel::Error, ex.what());
        return 2;
    }
    Logger::setMinLevel(config.log_level);

    // Without an explicit shape, assume the nominal sensor size for the configured resolution.
    const FrameShape shape = options.shape.value_or(nominalShape(config.resolution));
    const std::string path = SharedFrameBuffer::pathFor(config.buffer_dir, options.name);

    int count = 0;
    while (g_running) {
        try {
            std::uint64_t sequence = 0;
            const auto bytes = SharedFrameBuffer::read(path, shape, config.buffer_mode, &sequence);
            Logger::log(LogLevel::Info, path + ": " + summarize(bytes, shape, config.buffer_mode, sequence));
        } catch (const NotFoundError& ex) {
            Logger::log(LogLevel::Warn, ex.what());
        } catch (const SensorError& ex) {
            Logger::log(LogLevel::Error, ex.what());
            return 1;
        }

        if (options.iterations > 0 && ++count >= options.iterations) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(options.interval_ms));
    }

    return 0;
}
