#include "zedframe/SharedFrameBuffer.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>
#include <utility>

#include "zedframe/Errors.hpp"
#include "zedframe/Logger.hpp"

namespace zedframe {
namespace {

using SequenceCounter = std::atomic<std::uint64_t>;

static_assert(SequenceCounter::is_always_lock_free, "seqlock counter must be lock-free to live in shared memory");
static_assert(sizeof(SequenceCounter) == sizeof(std::uint64_t), "seqlock counter must be 8 bytes");

std::string errnoMessage(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

SequenceCounter* counterAt(std::uint8_t* base) {
    return reinterpret_cast<SequenceCounter*>(base);
}

const SequenceCounter* counterAt(const std::uint8_t* base) {
    return reinterpret_cast<const SequenceCounter*>(base);
}

std::size_t payloadOffset(BufferMode mode) {
    return mode == BufferMode::Sequenced ? SharedFrameBuffer::kSequencedHeaderBytes : 0;
}

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    int release() { return std::exchange(fd_, -1); }

private:
    int fd_;
};

class ScopedMapping {
public:
    ScopedMapping(void* addr, std::size_t size) : addr_(addr), size_(size) {}
    ~ScopedMapping() {
        if (addr_ != MAP_FAILED && addr_ != nullptr) {
            ::munmap(addr_, size_);
        }
    }
    ScopedMapping(const ScopedMapping&) = delete;
    ScopedMapping& operator=(const ScopedMapping&) = delete;

    bool valid() const { return addr_ != MAP_FAILED; }
    const std::uint8_t* data() const { return static_cast<const std::uint8_t*>(addr_); }

private:
    void* addr_;
    std::size_t size_;
};

} // namespace

SharedFrameBuffer::SharedFrameBuffer(std::string path, FrameShape shape, BufferMode mode)
    : path_(std::move(path)), shape_(shape), mode_(mode), size_(regionSize(shape, mode)) {
    if (shape_.bytes() == 0) {
        throw SharedBufferError("Shared buffer " + path_ + " declared with empty shape " + shape_.toString());
    }
}

SharedFrameBuffer::~SharedFrameBuffer() {
    release();
}

SharedFrameBuffer::SharedFrameBuffer(SharedFrameBuffer&& other) noexcept
    : path_(std::move(other.path_)),
      shape_(other.shape_),
      mode_(other.mode_),
      fd_(std::exchange(other.fd_, -1)),
      base_(std::exchange(other.base_, nullptr)),
      size_(other.size_),
      write_count_(other.write_count_) {}

SharedFrameBuffer& SharedFrameBuffer::operator=(SharedFrameBuffer&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        shape_ = other.shape_;
        mode_ = other.mode_;
        fd_ = std::exchange(other.fd_, -1);
        base_ = std::exchange(other.base_, nullptr);
        size_ = other.size_;
        write_count_ = other.write_count_;
    }
    return *this;
}

std::size_t SharedFrameBuffer::regionSize(const FrameShape& shape, BufferMode mode) {
    return payloadOffset(mode) + shape.bytes();
}

std::string SharedFrameBuffer::pathFor(const std::string& directory, const std::string& name) {
    if (directory.empty() || directory == ".") {
        return name;
    }
    if (directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

void SharedFrameBuffer::map() {
    ScopedFd guard(::open(path_.c_str(), O_RDWR | O_CREAT, 0666));
    if (guard.get() < 0) {
        throw SharedBufferError(errnoMessage("Failed to open shared buffer", path_));
    }
    const int fd = guard.get();

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        throw SharedBufferError(errnoMessage("Failed to stat shared buffer", path_));
    }
    // Reuse the existing file; only grow it when it is too small for the shape.
    const bool grown = static_cast<std::size_t>(st.st_size) < size_;
    if (grown) {
        if (st.st_size != 0) {
            Logger::log(LogLevel::Warn, "Growing shared buffer " + path_ + " to " + std::to_string(size_) + " bytes.");
        }
        if (::ftruncate(fd, static_cast<off_t>(size_)) != 0) {
            throw SharedBufferError(errnoMessage("Failed to size shared buffer", path_));
        }
    }

    void* addr = ::mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (addr == MAP_FAILED) {
        throw SharedBufferError(errnoMessage("Failed to map shared buffer", path_));
    }

    base_ = static_cast<std::uint8_t*>(addr);
    fd_ = guard.release();

    // A short file left by a plain-mode writer has frame bytes where the
    // counter goes; restart the sequence instead of inheriting them.
    if (grown && mode_ == BufferMode::Sequenced) {
        counterAt(base_)->store(0, std::memory_order_release);
    }
}

void SharedFrameBuffer::release() {
    if (base_ != nullptr) {
        ::munmap(base_, size_);
        base_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SharedFrameBuffer::write(const Frame& frame) {
    if (frame.shape() != shape_) {
        throw SharedBufferError("Frame shape " + frame.shape().toString() + " does not match shared buffer " +
                                path_ + " shape " + shape_.toString());
    }
    write(frame.data.data(), frame.data.size());
}

void SharedFrameBuffer::write(const std::uint8_t* bytes, std::size_t size) {
    if (size != shape_.bytes()) {
        std::ostringstream oss;
        oss << "Shared buffer " << path_ << " expects " << shape_.bytes() << " bytes, got " << size;
        throw SharedBufferError(oss.str());
    }
    if (base_ == nullptr) {
        map();
    }

    std::uint8_t* payload = base_ + payloadOffset(mode_);
    if (mode_ == BufferMode::Plain) {
        std::memcpy(payload, bytes, size);
    } else {
        SequenceCounter* counter = counterAt(base_);
        // Resume from the next even value so a counter left odd by a crashed
        // writer does not invert the protocol.
        const std::uint64_t current = counter->load(std::memory_order_relaxed);
        const std::uint64_t start = (current + 1) & ~std::uint64_t{1};
        counter->store(start + 1, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);
        std::memcpy(payload, bytes, size);
        counter->store(start + 2, std::memory_order_release);
    }
    ++write_count_;
}

void SharedFrameBuffer::writeOnce(const std::string& path, const Frame& frame, BufferMode mode) {
    SharedFrameBuffer buffer(path, frame.shape(), mode);
    buffer.write(frame);
}

std::vector<std::uint8_t> SharedFrameBuffer::read(const std::string& path, const FrameShape& shape,
                                                  BufferMode mode, std::uint64_t* sequence, int max_retries) {
    const std::size_t size = regionSize(shape, mode);
    if (shape.bytes() == 0) {
        throw SharedBufferError("Cannot read shared buffer " + path + " with empty shape " + shape.toString());
    }

    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            throw NotFoundError("Shared buffer not found: " + path);
        }
        throw SharedBufferError(errnoMessage("Failed to open shared buffer", path));
    }
    ScopedFd guard(fd);

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        throw SharedBufferError(errnoMessage("Failed to stat shared buffer", path));
    }
    // The writer creates the file before sizing it; an empty file has not
    // been written yet.
    if (st.st_size == 0) {
        throw NotFoundError("Shared buffer " + path + " has not been written yet");
    }
    if (static_cast<std::size_t>(st.st_size) < size) {
        std::ostringstream oss;
        oss << "Shared buffer " << path << " holds " << st.st_size << " bytes, shape " << shape.toString()
            << " needs " << size;
        throw SharedBufferError(oss.str());
    }

    // Copy-on-write mapping: nothing done here can reach the backing file.
    ScopedMapping mapping(::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0), size);
    if (!mapping.valid()) {
        throw SharedBufferError(errnoMessage("Failed to map shared buffer", path));
    }

    std::vector<std::uint8_t> out(shape.bytes());
    const std::uint8_t* payload = mapping.data() + payloadOffset(mode);

    if (mode == BufferMode::Plain) {
        std::memcpy(out.data(), payload, out.size());
        return out;
    }

    const SequenceCounter* counter = counterAt(mapping.data());
    for (int attempt = 0; attempt <= max_retries; ++attempt) {
        const std::uint64_t before = counter->load(std::memory_order_acquire);
        if (before == 0) {
            throw NotFoundError("Shared buffer " + path + " has no completed write yet");
        }
        if ((before & 1u) != 0) {
            std::this_thread::yield();
            continue;
        }
        std::memcpy(out.data(), payload, out.size());
        std::atomic_thread_fence(std::memory_order_acquire);
        const std::uint64_t after = counter->load(std::memory_order_relaxed);
        if (before == after) {
            if (sequence != nullptr) {
                *sequence = before;
            }
            return out;
        }
    }

    std::ostringstream oss;
    oss << "Shared buffer " << path << " kept changing during " << max_retries << " read retries";
    throw SharedBufferError(oss.str());
}

Frame SharedFrameBuffer::readFrame(const std::string& path, const FrameShape& shape, FrameKind kind, BufferMode mode,
                                   std::uint64_t* sequence) {
    Frame frame;
    frame.kind = kind;
    frame.height = shape.height;
    frame.width = shape.width;
    frame.channels = shape.channels;
    frame.data = read(path, shape, mode, sequence);
    return frame;
}

} // namespace zedframe
