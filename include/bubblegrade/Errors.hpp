#pragma once
#include <stdexcept>
#include <string>

namespace bubblegrade {

// Base class for every error raised by the library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Layout document is missing required fields or violates the schema.
class MalformedLayoutError : public Error {
public:
    explicit MalformedLayoutError(const std::string& message)
        : Error("Malformed layout: " + message) {}
};

// Answer key document cannot be turned into question specs.
class InvalidAnswerKeyError : public Error {
public:
    explicit InvalidAnswerKeyError(const std::string& message)
        : Error("Invalid answer key: " + message) {}
};

// Scoring inputs that can never come from a well-formed key/response pair.
class InvalidScoreError : public Error {
public:
    explicit InvalidScoreError(const std::string& message)
        : Error("Invalid score: " + message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error("Config error: " + message) {}
};

// Scan document could not be turned into raster pages.
class RasterError : public Error {
public:
    explicit RasterError(const std::string& message)
        : Error("Raster error: " + message) {}
};

// Job lookup / state machine violations and job-level failures.
class GradingJobError : public Error {
public:
    explicit GradingJobError(const std::string& message) : Error(message) {}
};

}
