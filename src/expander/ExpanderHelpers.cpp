#include "ExpanderHelpers.h"

#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

namespace expander::helpers {

std::string trim(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

std::string trimTrailingNewlines(const std::string &text) {
  size_t end = text.size();
  while (end > 0 && text[end - 1] == '\n') {
    --end;
  }
  return text.substr(0, end);
}

DirectiveMatch parseIncludeDirective(const std::string &line, const std::string &prefix, IncludeDirective &out) {
  size_t start = 0;
  while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) {
    ++start;
  }
  if (prefix.empty() || line.compare(start, prefix.size(), prefix) != 0) {
    return DirectiveMatch::None;
  }
  std::string target = trim(line.substr(start + prefix.size()));
  if (target.empty()) {
    return DirectiveMatch::EmptyTarget;
  }
  out.indentation = line.substr(0, start);
  out.targetPath = std::move(target);
  return DirectiveMatch::Include;
}

std::vector<std::string> splitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    size_t next = end == std::string::npos ? text.size() : end + 1;
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = next;
  }
  return lines;
}

void appendIndentedBlock(const std::string &content, const std::string &indentation, std::string &out) {
  std::string body = content;
  if (!body.empty() && body.back() == '\n') {
    body.pop_back();
  }
  if (body.empty()) {
    return;
  }
  for (const auto &line : splitLines(body)) {
    out.append(indentation);
    out.append(line);
    out.push_back('\n');
  }
}

std::string joinIncludePath(const std::string &hostFile, const std::string &targetPath) {
  std::filesystem::path target(targetPath);
  std::filesystem::path joined = std::filesystem::path(hostFile).parent_path() / target.relative_path();
  return joined.lexically_normal().string();
}

std::string markerPath(const std::string &filePath, const std::string &rootDirectory) {
  const std::string fallback = std::filesystem::path(filePath).generic_string();
  std::error_code ec;
  std::filesystem::path file = std::filesystem::absolute(filePath, ec);
  if (ec) {
    return fallback;
  }
  std::filesystem::path root = std::filesystem::absolute(rootDirectory, ec);
  if (ec) {
    return fallback;
  }
  root = root.lexically_normal();
  if (!root.has_filename() && root.has_relative_path()) {
    root = root.parent_path();
  }
  std::filesystem::path relative = file.lexically_normal().lexically_relative(root);
  if (relative.empty()) {
    return fallback;
  }
  return relative.generic_string();
}

std::string canonicalPathKey(const std::string &path) {
  std::error_code ec;
  std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
  if (!ec) {
    return canonical.string();
  }
  std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path;
  }
  return absolute.lexically_normal().string();
}

std::string describeIncludeChain(const std::vector<std::string> &activeFiles, const std::string &reentered) {
  std::string chain;
  bool inCycle = false;
  for (const auto &file : activeFiles) {
    if (file == reentered) {
      inCycle = true;
    }
    if (!inCycle) {
      continue;
    }
    chain += file;
    chain += " -> ";
  }
  chain += reentered;
  return chain;
}

std::string systemErrorMessage(int code) {
  if (code == 0) {
    return "unknown error";
  }
  return std::generic_category().message(code);
}

} // namespace expander::helpers
