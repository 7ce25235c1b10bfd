#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  None,
  BridgeUnavailable,
  NoWritablePath,
  DirectoryCreateFailed,
  PushFailed,
  DownloadFailed,
  ConflictCancelled,
  ManifestInvalid
};

inline const char* error_kind_label(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::BridgeUnavailable: return "bridge_unavailable";
    case ErrorKind::NoWritablePath: return "no_writable_path";
    case ErrorKind::DirectoryCreateFailed: return "directory_create_failed";
    case ErrorKind::PushFailed: return "push_failed";
    case ErrorKind::DownloadFailed: return "download_failed";
    case ErrorKind::ConflictCancelled: return "conflict_cancelled";
    case ErrorKind::ManifestInvalid: return "manifest_invalid";
  }
  return "unknown";
}

// Raised only for conditions that end the whole run; per-file and per-device
// failures travel as result values instead.
class OnboardError : public std::runtime_error {
public:
  OnboardError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};
