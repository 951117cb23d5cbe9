#include "expander/Expander.h"
#include "expander/Options.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace {
bool parseArgs(int argc, char **argv, expander::Options &out, std::string &error) {
  if (argc != 2) {
    error = "A single directory path must be provided as an argument.";
    return false;
  }
  std::string arg = argv[1];
  if (arg.empty()) {
    error = "A single directory path must be provided as an argument.";
    return false;
  }
  out.rootDirectory = arg;
  return true;
}

bool validateRootDirectory(const std::string &rootDirectory, std::string &error) {
  std::error_code ec;
  std::filesystem::file_status status = std::filesystem::status(rootDirectory, ec);
  if (ec || !std::filesystem::exists(status)) {
    const std::string cause =
        ec ? ec.message() : std::make_error_code(std::errc::no_such_file_or_directory).message();
    error = "Cannot access directory '" + rootDirectory + "': " + cause;
    return false;
  }
  if (!std::filesystem::is_directory(status)) {
    error = "The provided path '" + rootDirectory + "' is not a directory.";
    return false;
  }
  return true;
}

bool locateTemplate(const expander::Options &options, std::string &templatePath, std::string &error) {
  std::filesystem::path candidate = std::filesystem::path(options.rootDirectory) / options.templateFileName;
  std::error_code ec;
  if (!std::filesystem::exists(candidate, ec)) {
    const std::string cause =
        ec ? ec.message() : std::make_error_code(std::errc::no_such_file_or_directory).message();
    error = "'" + options.templateFileName + "' not found in directory '" + options.rootDirectory + "': " + cause;
    return false;
  }
  templatePath = candidate.string();
  return true;
}
} // namespace

int main(int argc, char **argv) {
  expander::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    std::cerr << "Usage: expander <directory>\n";
    std::cerr << "Error: " << argError << "\n";
    return 2;
  }

  std::string error;
  if (!validateRootDirectory(options.rootDirectory, error)) {
    std::cerr << "Error: " << error << "\n";
    return 2;
  }
  std::string templatePath;
  if (!locateTemplate(options, templatePath, error)) {
    std::cerr << "Error: " << error << "\n";
    return 2;
  }

  expander::StreamDiagnosticSink diagnostics(std::cerr);
  expander::Expander templateExpander(diagnostics, options.expand);
  std::string content;
  expander::ExpandError expandError;
  if (!templateExpander.expandFile(templatePath, options.rootDirectory, true, content, expandError)) {
    std::cerr << "Failed to expand template: " << expandError.toString() << "\n";
    return 2;
  }

  std::cout << content;
  return 0;
}
