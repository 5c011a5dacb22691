#include "l1host/library_locator.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <redlog.hpp>

namespace fs = std::filesystem;

namespace l1::host {
namespace {

auto log = redlog::get_logger("l1host.locator");

std::vector<std::string> split_search_path(const std::string& value) {
  const char delimiter = value.find(':') != std::string::npos ? ':' : ';';
  std::vector<std::string> paths;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(delimiter, start);
    if (end == std::string::npos) {
      end = value.size();
    }
    if (end > start) {
      paths.push_back(value.substr(start, end - start));
    }
    start = end + 1;
  }
  return paths;
}

bool is_file(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::optional<std::string> check_directory(const std::string& name, const fs::path& directory) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return std::nullopt;
  }

  log.ped("searching directory", redlog::field("name", name), redlog::field("directory", directory.string()));
  if (auto candidate = directory / name; is_file(candidate)) {
    return candidate.string();
  }

  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec)) {
      continue;
    }
    if (auto candidate = it->path() / name; is_file(candidate)) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

} // namespace

std::vector<std::string> default_search_paths() {
  std::vector<std::string> paths;
  if (const char* ld_library_path = std::getenv("LD_LIBRARY_PATH")) {
    paths = split_search_path(ld_library_path);
  }
  if constexpr (sizeof(void*) == 8) {
    paths.push_back("/lib64");
    paths.push_back("/usr/lib64");
  } else {
    paths.push_back("/lib32");
    paths.push_back("/usr/lib32");
  }
  paths.push_back("/lib");
  paths.push_back("/usr/lib");
  return paths;
}

std::optional<std::string> locate_library(const std::string& name, const std::vector<std::string>& extra_paths) {
  if (name.empty()) {
    return std::nullopt;
  }

  if (name.find('/') != std::string::npos) {
    if (is_file(name)) {
      return name;
    }
    log.dbg("library path does not exist", redlog::field("path", name));
    return std::nullopt;
  }

  for (const auto& directory : extra_paths) {
    if (auto found = check_directory(name, directory)) {
      log.trc("located library", redlog::field("name", name), redlog::field("path", *found));
      return found;
    }
  }
  for (const auto& directory : default_search_paths()) {
    if (auto found = check_directory(name, directory)) {
      log.trc("located library", redlog::field("name", name), redlog::field("path", *found));
      return found;
    }
  }

  log.dbg("library not found in search path", redlog::field("name", name));
  return std::nullopt;
}

} // namespace l1::host
