#pragma once

#include <optional>
#include <string>
#include <vector>

namespace l1::host {

// finds a shared object by name in ld.so search order.
// extra_paths come first, then LD_LIBRARY_PATH, then the system library directories.
// each directory is checked directly and one level down, which covers multiarch layouts.
// a name containing '/' is taken as a path and only checked for existence.
std::optional<std::string> locate_library(const std::string& name, const std::vector<std::string>& extra_paths = {});

// directories searched after extra_paths, in order
std::vector<std::string> default_search_paths();

} // namespace l1::host
