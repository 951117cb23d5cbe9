#pragma once

#include <string>
#include <vector>

namespace expander::helpers {

enum class DirectiveMatch {
  None,
  EmptyTarget,
  Include,
};

struct IncludeDirective {
  std::string indentation;
  std::string targetPath;
};

std::string trim(const std::string &text);
std::string trimTrailingNewlines(const std::string &text);
DirectiveMatch parseIncludeDirective(const std::string &line, const std::string &prefix, IncludeDirective &out);
std::vector<std::string> splitLines(const std::string &text);
void appendIndentedBlock(const std::string &content, const std::string &indentation, std::string &out);
std::string joinIncludePath(const std::string &hostFile, const std::string &targetPath);
std::string markerPath(const std::string &filePath, const std::string &rootDirectory);
std::string canonicalPathKey(const std::string &path);
std::string describeIncludeChain(const std::vector<std::string> &activeFiles, const std::string &reentered);
std::string systemErrorMessage(int code);

} // namespace expander::helpers
