#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "l1host/library_locator.hpp"

#ifndef L1_SAMPLE_LIBRARY_PATH
#error "L1_SAMPLE_LIBRARY_PATH must name the sample shared library"
#endif

namespace fs = std::filesystem;

namespace {

struct scoped_library_path {
  explicit scoped_library_path(const std::string& value) {
    if (const char* previous = std::getenv("LD_LIBRARY_PATH")) {
      had_previous_ = true;
      previous_ = previous;
    }
    setenv("LD_LIBRARY_PATH", value.c_str(), 1);
  }
  ~scoped_library_path() {
    if (had_previous_) {
      setenv("LD_LIBRARY_PATH", previous_.c_str(), 1);
    } else {
      unsetenv("LD_LIBRARY_PATH");
    }
  }

  bool had_previous_ = false;
  std::string previous_;
};

const fs::path& sample_path() {
  static const fs::path path(L1_SAMPLE_LIBRARY_PATH);
  return path;
}

std::string sample_name() { return sample_path().filename().string(); }

} // namespace

TEST_CASE("l1host locator accepts existing paths as given") {
  auto found = l1::host::locate_library(L1_SAMPLE_LIBRARY_PATH);
  REQUIRE(found.has_value());
  CHECK(*found == L1_SAMPLE_LIBRARY_PATH);

  CHECK_FALSE(l1::host::locate_library("/nonexistent/l1_missing_library.so").has_value());
  CHECK_FALSE(l1::host::locate_library("").has_value());
}

TEST_CASE("l1host locator searches extra paths first") {
  const std::vector<std::string> extra = {"/nonexistent/l1_dir", sample_path().parent_path().string()};
  auto found = l1::host::locate_library(sample_name(), extra);
  REQUIRE(found.has_value());
  CHECK(fs::equivalent(*found, sample_path()));
}

TEST_CASE("l1host locator looks one directory down") {
  // the sample library sits in test/libraries, so searching test/ finds it in a subdirectory
  const std::vector<std::string> extra = {sample_path().parent_path().parent_path().string()};
  auto found = l1::host::locate_library(sample_name(), extra);
  REQUIRE(found.has_value());
  CHECK(fs::equivalent(*found, sample_path()));
}

TEST_CASE("l1host locator honors LD_LIBRARY_PATH") {
  scoped_library_path env("/nonexistent/l1_dir:" + sample_path().parent_path().string());

  auto search = l1::host::default_search_paths();
  REQUIRE(search.size() >= 2);
  CHECK(search[0] == "/nonexistent/l1_dir");
  CHECK(search[1] == sample_path().parent_path().string());
  CHECK(search.back() == "/usr/lib");

  auto found = l1::host::locate_library(sample_name());
  REQUIRE(found.has_value());
  CHECK(fs::equivalent(*found, sample_path()));
}

TEST_CASE("l1host locator reports unknown names") {
  scoped_library_path env("/nonexistent/l1_dir");
  CHECK_FALSE(l1::host::locate_library("l1_library_that_does_not_exist.so").has_value());
}
