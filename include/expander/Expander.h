#pragma once

#include <string>
#include <utility>
#include <vector>

#include "expander/Diagnostics.h"
#include "expander/ExpandError.h"
#include "expander/Options.h"

namespace expander {

class Expander {
public:
  explicit Expander(ExpandOptions options = {});
  explicit Expander(DiagnosticSink &diagnostics, ExpandOptions options = {});
  Expander(const Expander &) = delete;
  Expander &operator=(const Expander &) = delete;

  // Expands filePath and every include it reaches. Included files are framed
  // with START/END markers whose paths are relative to rootDirectory; the
  // root document itself (isRoot) is not.
  bool expandFile(const std::string &filePath,
                  const std::string &rootDirectory,
                  bool isRoot,
                  std::string &out,
                  ExpandError &error);

  // Expands a single file, or every file below a directory in lexical order.
  bool resolveInclude(const std::string &targetPath,
                      const std::string &rootDirectory,
                      std::string &out,
                      ExpandError &error);

  const ExpandOptions &options() const { return options_; }

private:
  bool expandDirectory(const std::string &directoryPath,
                       const std::string &rootDirectory,
                       std::string &out,
                       ExpandError &error);

  struct ActiveFileGuard {
    ActiveFileGuard(Expander &expander, std::string path) : expander_(expander) {
      expander_.activeFiles_.push_back(std::move(path));
    }
    ~ActiveFileGuard() { expander_.activeFiles_.pop_back(); }
    ActiveFileGuard(const ActiveFileGuard &) = delete;
    ActiveFileGuard &operator=(const ActiveFileGuard &) = delete;

  private:
    Expander &expander_;
  };

  StreamDiagnosticSink defaultDiagnostics_;
  DiagnosticSink &diagnostics_;
  ExpandOptions options_;
  std::vector<std::string> activeFiles_;
};

} // namespace expander
