#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace expander {

class DiagnosticSink {
public:
  virtual ~DiagnosticSink() = default;
  virtual void warning(const std::string &message) = 0;
};

class StreamDiagnosticSink : public DiagnosticSink {
public:
  StreamDiagnosticSink();
  explicit StreamDiagnosticSink(std::ostream &out);

  void warning(const std::string &message) override;

private:
  std::ostream &out_;
};

class CollectingDiagnosticSink : public DiagnosticSink {
public:
  void warning(const std::string &message) override { warnings.push_back(message); }

  std::vector<std::string> warnings;
};

} // namespace expander
