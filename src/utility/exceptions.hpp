#pragma once

#include <stdexcept>
#include <string>

namespace halo {

/**
 * Base exception class for all cursor_halo errors
 */
class HaloException : public std::runtime_error {
  public:
    explicit HaloException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Exception for failures of the host toolkit (window, monitor or input
 * subsystems that could not be brought up)
 */
class PlatformError : public HaloException {
  public:
    explicit PlatformError(const std::string &message)
        : HaloException("Platform error: " + message) {}
};

/**
 * Exception for rendering-related errors
 */
class RenderError : public HaloException {
  public:
    explicit RenderError(const std::string &message)
        : HaloException("Render error: " + message) {}
};

/**
 * Exception for operations requested in a lifecycle state that does not
 * allow them
 */
class StateError : public HaloException {
  public:
    explicit StateError(const std::string &message)
        : HaloException("State error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public HaloException {
  public:
    explicit ConfigError(const std::string &message)
        : HaloException("Configuration error: " + message) {}
};

} // namespace halo
