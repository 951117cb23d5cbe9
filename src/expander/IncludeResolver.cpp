#include "expander/Expander.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace expander {

bool Expander::resolveInclude(const std::string &targetPath,
                              const std::string &rootDirectory,
                              std::string &out,
                              ExpandError &error) {
  std::error_code ec;
  std::filesystem::file_status status = std::filesystem::status(targetPath, ec);
  if (ec || !std::filesystem::exists(status)) {
    const std::string cause =
        ec ? ec.message() : std::make_error_code(std::errc::no_such_file_or_directory).message();
    error.set(ExpandErrorKind::PathNotFound, "include path not found " + targetPath + ": " + cause);
    return false;
  }
  if (std::filesystem::is_directory(status)) {
    return expandDirectory(targetPath, rootDirectory, out, error);
  }
  return expandFile(targetPath, rootDirectory, false, out, error);
}

bool Expander::expandDirectory(const std::string &directoryPath,
                               const std::string &rootDirectory,
                               std::string &out,
                               ExpandError &error) {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(directoryPath, ec);
  std::filesystem::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code typeEc;
    if (std::filesystem::is_directory(it->symlink_status(typeEc))) {
      continue;
    }
    files.push_back(it->path());
  }
  if (ec) {
    error.set(ExpandErrorKind::DirectoryWalk, "failed to walk directory " + directoryPath + ": " + ec.message());
    return false;
  }
  std::sort(files.begin(), files.end());

  std::string result;
  for (const auto &file : files) {
    std::string content;
    if (!expandFile(file.string(), rootDirectory, false, content, error)) {
      error.wrap(ExpandErrorKind::DirectoryWalk,
                 "failed to process file " + file.string() + " in directory " + directoryPath);
      return false;
    }
    result += content;
  }
  out = std::move(result);
  return true;
}

} // namespace expander
