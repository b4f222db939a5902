#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Data,
    OutOfBounds,
    TooFarFromRoad,
    NoPath,
    InvalidInput
};

// Name used on the route-query wire format ("OutOfBounds", ...).
const char *error_kind_name(ErrorKind kind);

class NavError : public std::runtime_error {
public:
    NavError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Road dataset cannot produce a usable graph. Fatal at build time.
class DataError : public NavError {
public:
    explicit DataError(const std::string &message) : NavError(ErrorKind::Data, message) {}
};

class OutOfBoundsError : public NavError {
public:
    explicit OutOfBoundsError(const std::string &message) : NavError(ErrorKind::OutOfBounds, message) {}
};

class TooFarFromRoadError : public NavError {
public:
    TooFarFromRoadError(const std::string &message, double distance_m)
        : NavError(ErrorKind::TooFarFromRoad, message), distance_m_(distance_m) {}

    double distance() const { return distance_m_; }

private:
    double distance_m_;
};

class NoPathError : public NavError {
public:
    explicit NoPathError(const std::string &message) : NavError(ErrorKind::NoPath, message) {}
};

class InvalidInputError : public NavError {
public:
    explicit InvalidInputError(const std::string &message) : NavError(ErrorKind::InvalidInput, message) {}
};

inline const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Data: return "Data";
        case ErrorKind::OutOfBounds: return "OutOfBounds";
        case ErrorKind::TooFarFromRoad: return "TooFarFromRoad";
        case ErrorKind::NoPath: return "NoPath";
        case ErrorKind::InvalidInput: return "InvalidInput";
    }
    return "InvalidInput";
}
