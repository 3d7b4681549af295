#pragma once

#include <stdexcept>
#include <string>

namespace insar_rate {

class InsarRateError : public std::runtime_error {
public:
    explicit InsarRateError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public InsarRateError {
public:
    explicit ConfigError(const std::string& message)
        : InsarRateError("Config error: " + message) {}
};

class ValidationError : public InsarRateError {
public:
    explicit ValidationError(const std::string& message)
        : InsarRateError("Validation error: " + message) {}
};

class IOError : public InsarRateError {
public:
    explicit IOError(const std::string& message)
        : InsarRateError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class PipelineError : public InsarRateError {
public:
    explicit PipelineError(const std::string& message)
        : InsarRateError("Pipeline error: " + message) {}
};

class ParallelError : public InsarRateError {
public:
    explicit ParallelError(const std::string& message)
        : InsarRateError("Parallel error: " + message) {}
};

// Raised when a rank observes shared state that another rank has not
// (or not completely) published yet.
class SynchronizationError : public ParallelError {
public:
    explicit SynchronizationError(const std::string& message)
        : ParallelError("Synchronization error: " + message) {}
};

class ReferencePixelError : public InsarRateError {
public:
    explicit ReferencePixelError(const std::string& message)
        : InsarRateError("Reference pixel error: " + message) {}
};

class ReferencePhaseError : public InsarRateError {
public:
    explicit ReferencePhaseError(const std::string& message)
        : InsarRateError("Reference phase error: " + message) {}
};

class OrbitalError : public InsarRateError {
public:
    explicit OrbitalError(const std::string& message)
        : InsarRateError("Orbital correction error: " + message) {}
};

class CovarianceError : public InsarRateError {
public:
    explicit CovarianceError(const std::string& message)
        : InsarRateError("Covariance error: " + message) {}
};

} // namespace insar_rate
