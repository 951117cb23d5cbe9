#pragma once

#include <string>

namespace expander {

inline constexpr const char *DefaultTemplateFileName = "cloud-init.tmpl.yaml";
inline constexpr const char *DefaultDirectivePrefix = "#include:";

struct ExpandOptions {
  std::string directivePrefix = DefaultDirectivePrefix;
  bool detectCycles = true;
};

struct Options {
  std::string rootDirectory;
  std::string templateFileName = DefaultTemplateFileName;
  ExpandOptions expand;
};

} // namespace expander
