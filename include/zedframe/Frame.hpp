#pragma once
// Dense 8-bit image and depth frames.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zedframe {

enum class FrameKind {
    Image,
    DepthMap
};

struct FrameShape {
    int height = 0;
    int width = 0;
    int channels = 0;

    std::size_t bytes() const;
    bool operator==(const FrameShape& other) const;
    bool operator!=(const FrameShape& other) const { return !(*this == other); }

    // Parses "HxWxC", e.g. "1080x1920x3".
    static FrameShape parse(const std::string& text);
    std::string toString() const;
};

struct Frame {
    FrameKind kind = FrameKind::Image;
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<std::uint8_t> data; // row-major, one byte per channel

    Frame() = default;
    Frame(FrameKind kind, int width, int height, int channels);

    FrameShape shape() const { return FrameShape{height, width, channels}; }
    bool empty() const { return data.empty(); }
    std::size_t sizeBytes() const { return data.size(); }

    std::uint8_t* ptr(int row = 0) { return data.data() + static_cast<std::size_t>(row) * rowBytes(); }
    const std::uint8_t* ptr(int row = 0) const {
        return data.data() + static_cast<std::size_t>(row) * rowBytes();
    }
    std::size_t rowBytes() const { return static_cast<std::size_t>(width) * static_cast<std::size_t>(channels); }
};

// Copies the first `keep` channels of every pixel. Used to turn the BGRA
// buffers the device delivers into BGR.
Frame extractChannels(const Frame& source, int keep);

const char* frameKindName(FrameKind kind);

} // namespace zedframe
