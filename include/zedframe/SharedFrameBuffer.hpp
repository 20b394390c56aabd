#pragma once
// Named memory-mapped region holding the latest frame for other processes.
//
// The file holds exactly one frame, row-major, one byte per channel. The shape
// is not stored; writer and reader agree on it out of band. In Plain mode there
// is no synchronization at all and a reader racing a write can observe a mix of
// two frames. Sequenced mode puts a 64-byte header in front of the bytes whose
// first 8 bytes are a seqlock counter: odd while a write is in progress, bumped
// by two per completed write.
//
// The mode is part of the region's contract, like the shape. A Sequenced writer
// that has to grow a file restarts the counter at 0; a leftover file that is
// already large enough is reused as is, so delete it when switching modes.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "zedframe/Frame.hpp"
#include "zedframe/SensorConfig.hpp"

namespace zedframe {

class SharedFrameBuffer {
public:
    static constexpr std::size_t kSequencedHeaderBytes = 64;
    static constexpr int kDefaultReadRetries = 1000;

    // Maps lazily: the backing file is created (or reopened without
    // truncation) on the first write.
    SharedFrameBuffer(std::string path, FrameShape shape, BufferMode mode = BufferMode::Plain);
    ~SharedFrameBuffer();

    SharedFrameBuffer(const SharedFrameBuffer&) = delete;
    SharedFrameBuffer& operator=(const SharedFrameBuffer&) = delete;
    SharedFrameBuffer(SharedFrameBuffer&& other) noexcept;
    SharedFrameBuffer& operator=(SharedFrameBuffer&& other) noexcept;

    // Throws SharedBufferError if the frame does not match the declared shape.
    void write(const Frame& frame);
    void write(const std::uint8_t* bytes, std::size_t size);

    // Releases the mapping. The file stays on disk.
    void release();

    bool mapped() const { return base_ != nullptr; }
    const std::string& path() const { return path_; }
    const FrameShape& shape() const { return shape_; }
    BufferMode mode() const { return mode_; }
    std::uint64_t writeCount() const { return write_count_; }

    static std::size_t regionSize(const FrameShape& shape, BufferMode mode);
    static std::string pathFor(const std::string& directory, const std::string& name);

    // One-shot write: open, copy, unmap.
    static void writeOnce(const std::string& path, const Frame& frame, BufferMode mode = BufferMode::Plain);

    // Maps the file copy-on-write and returns a copy of the frame bytes.
    // Throws NotFoundError if the region was never written. In Sequenced mode
    // `sequence` receives the counter of the copied frame.
    static std::vector<std::uint8_t> read(const std::string& path, const FrameShape& shape,
                                          BufferMode mode = BufferMode::Plain,
                                          std::uint64_t* sequence = nullptr,
                                          int max_retries = kDefaultReadRetries);

    static Frame readFrame(const std::string& path, const FrameShape& shape, FrameKind kind,
                           BufferMode mode = BufferMode::Plain, std::uint64_t* sequence = nullptr);

private:
    void map();

    std::string path_;
    FrameShape shape_;
    BufferMode mode_ = BufferMode::Plain;

    int fd_ = -1;
    std::uint8_t* base_ = nullptr;
    std::size_t size_ = 0;
    std::uint64_t write_count_ = 0;
};

} // namespace zedframe
