#pragma once

#include <string>
#include <vector>

namespace expander {

enum class ExpandErrorKind {
  PathNotFound,
  FileAccess,
  Read,
  IncludeResolution,
  DirectoryWalk,
  CycleDetected,
};

const char *expandErrorKindName(ExpandErrorKind kind);

struct ExpandErrorFrame {
  ExpandErrorKind kind = ExpandErrorKind::FileAccess;
  std::string message;
};

// Frames are stored innermost first; each frame that forwards a failure
// appends its own context with wrap().
struct ExpandError {
  std::vector<ExpandErrorFrame> frames;

  bool empty() const { return frames.empty(); }
  void clear() { frames.clear(); }

  void set(ExpandErrorKind kind, std::string message);
  void wrap(ExpandErrorKind kind, std::string message);

  ExpandErrorKind kind() const;
  ExpandErrorKind rootKind() const;
  bool hasKind(ExpandErrorKind kind) const;
  std::string toString() const;
};

} // namespace expander
