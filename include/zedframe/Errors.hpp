#pragma once
// Error taxonomy for sensor configuration, device access and frame exchange.

#include <stdexcept>
#include <string>

namespace zedframe {

class SensorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid view/resolution/fps combination or unparsable configuration.
class ConfigurationError : public SensorError {
public:
    using SensorError::SensorError;
};

// The device could not be opened. The sensor stays stopped.
class ActivationError : public SensorError {
public:
    using SensorError::SensorError;
};

// A pull failed while running. Terminal for the acquisition loop.
class CaptureError : public SensorError {
public:
    using SensorError::SensorError;
};

// Snapshot requested before the first frame arrived.
class NotReadyError : public SensorError {
public:
    using SensorError::SensorError;
};

// Depth requested from a sensor configured without depth.
class NotAvailableError : public SensorError {
public:
    using SensorError::SensorError;
};

// Cross-process read of a named buffer that was never written.
class NotFoundError : public SensorError {
public:
    using SensorError::SensorError;
};

// I/O or layout failure on a mapped region.
class SharedBufferError : public SensorError {
public:
    using SensorError::SensorError;
};

} // namespace zedframe
