#include "expander/ExpandError.h"

#include <utility>

namespace expander {

const char *expandErrorKindName(ExpandErrorKind kind) {
  switch (kind) {
  case ExpandErrorKind::PathNotFound:
    return "PathNotFoundError";
  case ExpandErrorKind::FileAccess:
    return "FileAccessError";
  case ExpandErrorKind::Read:
    return "ReadError";
  case ExpandErrorKind::IncludeResolution:
    return "IncludeResolutionError";
  case ExpandErrorKind::DirectoryWalk:
    return "DirectoryWalkError";
  case ExpandErrorKind::CycleDetected:
    return "CycleDetectedError";
  }
  return "UnknownError";
}

void ExpandError::set(ExpandErrorKind kind, std::string message) {
  frames.clear();
  frames.push_back({kind, std::move(message)});
}

void ExpandError::wrap(ExpandErrorKind kind, std::string message) {
  frames.push_back({kind, std::move(message)});
}

ExpandErrorKind ExpandError::kind() const {
  if (frames.empty()) {
    return ExpandErrorKind::FileAccess;
  }
  return frames.back().kind;
}

ExpandErrorKind ExpandError::rootKind() const {
  if (frames.empty()) {
    return ExpandErrorKind::FileAccess;
  }
  return frames.front().kind;
}

bool ExpandError::hasKind(ExpandErrorKind kind) const {
  for (const auto &frame : frames) {
    if (frame.kind == kind) {
      return true;
    }
  }
  return false;
}

std::string ExpandError::toString() const {
  std::string text;
  for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
    if (!text.empty()) {
      text += ": ";
    }
    text += it->message;
  }
  return text;
}

} // namespace expander
