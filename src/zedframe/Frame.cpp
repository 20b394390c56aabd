#include "zedframe/Frame.hpp"

#include <cstring>
#include <sstream>

#include "zedframe/Errors.hpp"

namespace zedframe {

std::size_t FrameShape::bytes() const {
    if (height <= 0 || width <= 0 || channels <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(height) * static_cast<std::size_t>(width) *
           static_cast<std::size_t>(channels);
}

bool FrameShape::operator==(const FrameShape& other) const {
    return height == other.height && width == other.width && channels == other.channels;
}

FrameShape FrameShape::parse(const std::string& text) {
    FrameShape shape;
    char sep1 = 0;
    char sep2 = 0;
    std::istringstream in(text);
    if (!(in >> shape.height >> sep1 >> shape.width >> sep2 >> shape.channels) || sep1 != 'x' ||
        sep2 != 'x' || !in.eof() || shape.bytes() == 0) {
        throw ConfigurationError("Invalid frame shape '" + text + "', expected HxWxC");
    }
    return shape;
}

std::string FrameShape::toString() const {
    std::ostringstream oss;
    oss << height << "x" << width << "x" << channels;
    return oss.str();
}

Frame::Frame(FrameKind kind, int width, int height, int channels)
    : kind(kind), width(width), height(height), channels(channels),
      data(FrameShape{height, width, channels}.bytes()) {}

Frame extractChannels(const Frame& source, int keep) {
    if (keep <= 0 || keep > source.channels) {
        std::ostringstream oss;
        oss << "Cannot keep " << keep << " of " << source.channels << " channels";
        throw std::invalid_argument(oss.str());
    }
    if (keep == source.channels) {
        return source;
    }

    Frame out(source.kind, source.width, source.height, keep);
    const std::size_t pixels = static_cast<std::size_t>(source.width) * static_cast<std::size_t>(source.height);
    const std::uint8_t* in = source.data.data();
    std::uint8_t* dst = out.data.data();
    for (std::size_t i = 0; i < pixels; ++i) {
        std::memcpy(dst, in, static_cast<std::size_t>(keep));
        in += source.channels;
        dst += keep;
    }
    return out;
}

const char* frameKindName(FrameKind kind) {
    switch (kind) {
        case FrameKind::Image:
            return "image";
        case FrameKind::DepthMap:
            return "depth map";
    }
    return "image";
}

} // namespace zedframe
