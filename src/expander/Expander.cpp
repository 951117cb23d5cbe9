#include "expander/Expander.h"

#include "ExpanderHelpers.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace expander {
using namespace helpers;

Expander::Expander(ExpandOptions options) : diagnostics_(defaultDiagnostics_), options_(std::move(options)) {}

Expander::Expander(DiagnosticSink &diagnostics, ExpandOptions options)
    : diagnostics_(diagnostics), options_(std::move(options)) {}

bool Expander::expandFile(const std::string &filePath,
                          const std::string &rootDirectory,
                          bool isRoot,
                          std::string &out,
                          ExpandError &error) {
  std::string activeKey = canonicalPathKey(filePath);
  if (options_.detectCycles &&
      std::find(activeFiles_.begin(), activeFiles_.end(), activeKey) != activeFiles_.end()) {
    error.set(ExpandErrorKind::CycleDetected,
              "include cycle detected: " + describeIncludeChain(activeFiles_, activeKey));
    return false;
  }

  std::error_code typeEc;
  if (std::filesystem::is_directory(filePath, typeEc)) {
    error.set(ExpandErrorKind::Read,
              "error reading file " + filePath + ": " + std::make_error_code(std::errc::is_a_directory).message());
    return false;
  }
  errno = 0;
  std::ifstream file(filePath);
  if (!file) {
    error.set(ExpandErrorKind::FileAccess, "failed to open file " + filePath + ": " + systemErrorMessage(errno));
    return false;
  }

  ActiveFileGuard activeGuard(*this, activeKey);
  const std::string relativePath = markerPath(filePath, rootDirectory);

  std::string result;
  if (!isRoot) {
    result += "# START " + relativePath + "\n";
  }

  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    IncludeDirective directive;
    DirectiveMatch match = parseIncludeDirective(line, options_.directivePrefix, directive);
    if (match == DirectiveMatch::None) {
      result += line;
      result.push_back('\n');
      continue;
    }
    if (match == DirectiveMatch::EmptyTarget) {
      std::string directiveName = options_.directivePrefix;
      if (!directiveName.empty() && directiveName.back() == ':') {
        directiveName.pop_back();
      }
      diagnostics_.warning("Warning: Found empty " + directiveName + " directive in " + filePath + ". Skipping.");
      continue;
    }

    const std::string includePath = joinIncludePath(filePath, directive.targetPath);
    std::string included;
    if (!resolveInclude(includePath, rootDirectory, included, error)) {
      error.wrap(ExpandErrorKind::IncludeResolution,
                 "error processing include '" + directive.targetPath + "' in file " + filePath);
      return false;
    }
    appendIndentedBlock(included, directive.indentation, result);
    result.push_back('\n');
  }
  if (file.bad()) {
    error.set(ExpandErrorKind::Read,
              "error reading file " + filePath + ": " + std::make_error_code(std::errc::io_error).message());
    return false;
  }

  if (!isRoot) {
    result = trimTrailingNewlines(result);
    result += "\n# END " + relativePath + "\n";
  }
  out = std::move(result);
  return true;
}

} // namespace expander
