#pragma once

#include <stdexcept>
#include <string>

namespace xrd_match {

class XrdMatchError : public std::runtime_error {
public:
    explicit XrdMatchError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public XrdMatchError {
public:
    explicit ConfigError(const std::string& message)
        : XrdMatchError("Config error: " + message) {}
};

class ValidationError : public XrdMatchError {
public:
    explicit ValidationError(const std::string& message)
        : XrdMatchError("Validation error: " + message) {}
};

class IOError : public XrdMatchError {
public:
    explicit IOError(const std::string& message)
        : XrdMatchError("I/O error: " + message) {}
};

// No encoding/delimiter/column combination turned the file into a numeric table.
class IngestFormatError : public IOError {
public:
    explicit IngestFormatError(const std::string& message)
        : IOError("Ingest format error: " + message) {}
};

class DataInsufficientError : public XrdMatchError {
public:
    DataInsufficientError(size_t valid_points, size_t required_points)
        : XrdMatchError("Insufficient data: " + std::to_string(valid_points) +
                        " valid points after cleaning, need at least " +
                        std::to_string(required_points)),
          valid_points_(valid_points), required_points_(required_points) {}

    size_t valid_points() const { return valid_points_; }
    size_t required_points() const { return required_points_; }

private:
    size_t valid_points_;
    size_t required_points_;
};

class NoReferenceDataError : public XrdMatchError {
public:
    explicit NoReferenceDataError(const std::string& message)
        : XrdMatchError("No reference data: " + message) {}
};

class InvalidToleranceError : public ValidationError {
public:
    explicit InvalidToleranceError(double tolerance)
        : ValidationError("match tolerance must be > 0, got " + std::to_string(tolerance)),
          tolerance_(tolerance) {}

    double tolerance() const { return tolerance_; }

private:
    double tolerance_;
};

} // namespace xrd_match
