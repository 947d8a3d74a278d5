#pragma once

#include <stdexcept>
#include <string>

namespace particle_sizer {

class ParticleSizerError : public std::runtime_error {
public:
    explicit ParticleSizerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ParticleSizerError {
public:
    explicit ConfigError(const std::string& message)
        : ParticleSizerError("Config error: " + message) {}
};

class ValidationError : public ParticleSizerError {
public:
    explicit ValidationError(const std::string& message)
        : ParticleSizerError("Validation error: " + message) {}
};

class IOError : public ParticleSizerError {
public:
    explicit IOError(const std::string& message)
        : ParticleSizerError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class PipelineError : public ParticleSizerError {
public:
    explicit PipelineError(const std::string& message)
        : ParticleSizerError("Pipeline error: " + message) {}
};

// Scale-bar selection holds no pixel attaining its maximum intensity
class EmptySelectionError : public ParticleSizerError {
public:
    explicit EmptySelectionError(const std::string& message)
        : ParticleSizerError("Empty selection: " + message) {}
};

// Scale-bar spans zero pixels, or the scale factor is not finite
class DegenerateScaleError : public ParticleSizerError {
public:
    explicit DegenerateScaleError(const std::string& message)
        : ParticleSizerError("Degenerate scale: " + message) {}
};

// No particle survives the size window
class EmptySampleError : public ParticleSizerError {
public:
    explicit EmptySampleError(const std::string& message)
        : ParticleSizerError("Empty sample: " + message) {}
};

class DimensionMismatchError : public ParticleSizerError {
public:
    explicit DimensionMismatchError(const std::string& message)
        : ParticleSizerError("Dimension mismatch: " + message) {}
};

} // namespace particle_sizer
