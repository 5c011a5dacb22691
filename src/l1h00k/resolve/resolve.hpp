#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "l1h00k/hook.hpp"

namespace l1::h00k::resolve {

struct module_info {
  void* base = nullptr;
  size_t size = 0;
  std::string path{};
  bool is_main = false;
};

enum class export_kind {
  function,
  object
};

struct export_symbol {
  std::string name{};
  void* address = nullptr;
  size_t size = 0;
  export_kind kind = export_kind::function;
};

struct symbol_resolution {
  void* address = nullptr;
  module_info module{};
  hook_error_info error{};
};

// modules in dynamic loader order; the main executable comes first
std::vector<module_info> enumerate_modules();
std::optional<module_info> main_module();
// module null or empty selects the main executable; names without a separator match by basename
std::optional<module_info> find_module(const char* module);

// defined function and object symbols with global or weak binding from the dynamic symbol table
std::vector<export_symbol> enumerate_exports(const module_info& module);
symbol_resolution find_export(const char* symbol, const char* module);

// dynamic linker lookup, then the module's export table
symbol_resolution resolve_symbol(const char* symbol, const char* module);
void* symbol_address(const char* symbol, const char* module);

} // namespace l1::h00k::resolve
