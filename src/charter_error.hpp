#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  UnsupportedFormat,
  DecodeError,
  EmptySignal,
  NoBeatsDetected,
  InvalidLaneCount,
  InvalidConfig,
  IoError,
  SerializationError,
};

inline const char* errorKindName(ErrorKind k) {
  switch (k) {
    case ErrorKind::UnsupportedFormat:  return "UnsupportedFormat";
    case ErrorKind::DecodeError:        return "DecodeError";
    case ErrorKind::EmptySignal:        return "EmptySignal";
    case ErrorKind::NoBeatsDetected:    return "NoBeatsDetected";
    case ErrorKind::InvalidLaneCount:   return "InvalidLaneCount";
    case ErrorKind::InvalidConfig:      return "InvalidConfig";
    case ErrorKind::IoError:            return "IoError";
    case ErrorKind::SerializationError: return "SerializationError";
  }
  return "Unknown";
}

// Every pipeline stage reports failure through this.
class CharterError : public std::runtime_error {
public:
  CharterError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}
  ErrorKind kind() const { return kind_; }
private:
  ErrorKind kind_;
};
