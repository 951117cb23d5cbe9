#include "expander/Diagnostics.h"

#include <iostream>

namespace expander {

StreamDiagnosticSink::StreamDiagnosticSink() : out_(std::cerr) {}

StreamDiagnosticSink::StreamDiagnosticSink(std::ostream &out) : out_(out) {}

void StreamDiagnosticSink::warning(const std::string &message) {
  out_ << message << "\n";
}

} // namespace expander
