#include "l1h00k/resolve/resolve.hpp"

#include <algorithm>
#include <cstring>
#include <string_view>
#include <type_traits>

#include <dlfcn.h>
#include <elf.h>
#include <link.h>
#include <unistd.h>

#include "l1base/string_utils.hpp"

namespace l1::h00k::resolve {
namespace {

hook_error_info make_error(hook_error code, const char* detail) {
  hook_error_info info{};
  info.code = code;
  info.detail = detail;
  return info;
}

bool module_matches(const char* requested, const module_info& module) {
  if (!requested || requested[0] == '\0') {
    return module.is_main;
  }
  if (module.path.empty()) {
    return false;
  }
  const std::string_view req_view(requested);
  if (req_view.find('/') != std::string_view::npos) {
    return module.path == req_view;
  }
  return l1::util::basename_view(module.path) == req_view;
}

std::string read_main_path() {
  char buffer[4096] = {};
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len <= 0) {
    return {};
  }
  return std::string(buffer, static_cast<size_t>(len));
}

struct elf_module_snapshot {
  const dl_phdr_info* info = nullptr;
  module_info module{};
};

elf_module_snapshot snapshot_module(const dl_phdr_info* info, bool is_first) {
  elf_module_snapshot snapshot{};
  snapshot.info = info;
  snapshot.module.is_main = is_first;

  if (info->dlpi_name && info->dlpi_name[0] != '\0') {
    snapshot.module.path = info->dlpi_name;
  } else if (is_first) {
    snapshot.module.path = read_main_path();
  }

  uintptr_t low = UINTPTR_MAX;
  uintptr_t high = 0;
  for (size_t i = 0; i < info->dlpi_phnum; ++i) {
    const ElfW(Phdr)& phdr = info->dlpi_phdr[i];
    if (phdr.p_type != PT_LOAD) {
      continue;
    }
    low = std::min(low, static_cast<uintptr_t>(phdr.p_vaddr));
    high = std::max(high, static_cast<uintptr_t>(phdr.p_vaddr + phdr.p_memsz));
  }
  if (low != UINTPTR_MAX) {
    snapshot.module.base = reinterpret_cast<void*>(static_cast<uintptr_t>(info->dlpi_addr) + low);
    snapshot.module.size = high - low;
  }
  return snapshot;
}

// visits every loaded object; the visitor returns true to stop
template <typename Visitor> void for_each_object(Visitor&& visitor) {
  struct context {
    std::remove_reference_t<Visitor>* visitor = nullptr;
    bool first = true;
  } ctx{&visitor, true};

  dl_iterate_phdr(
      [](struct dl_phdr_info* info, size_t, void* data) -> int {
        auto* ctx = static_cast<context*>(data);
        const bool is_first = ctx->first;
        ctx->first = false;
        return (*ctx->visitor)(snapshot_module(info, is_first)) ? 1 : 0;
      },
      &ctx
  );
}

// glibc rewrites dynamic entries to absolute addresses in place, other loaders leave them as vaddrs
uintptr_t dynamic_address(const dl_phdr_info* info, ElfW(Addr) value) {
  const auto bias = static_cast<uintptr_t>(info->dlpi_addr);
  const auto raw = static_cast<uintptr_t>(value);
  if (bias != 0 && raw < bias) {
    return bias + raw;
  }
  return raw;
}

struct dynamic_tables {
  const ElfW(Sym)* symtab = nullptr;
  const char* strtab = nullptr;
  size_t strsz = 0;
  const uint32_t* sysv_hash = nullptr;
  const uint32_t* gnu_hash = nullptr;
};

bool read_dynamic_tables(const dl_phdr_info* info, dynamic_tables& out) {
  const ElfW(Phdr)* dynamic_phdr = nullptr;
  for (size_t i = 0; i < info->dlpi_phnum; ++i) {
    if (info->dlpi_phdr[i].p_type == PT_DYNAMIC) {
      dynamic_phdr = &info->dlpi_phdr[i];
      break;
    }
  }
  if (!dynamic_phdr) {
    return false;
  }

  const auto* dyn = reinterpret_cast<const ElfW(Dyn)*>(info->dlpi_addr + dynamic_phdr->p_vaddr);
  for (const ElfW(Dyn)* entry = dyn; entry->d_tag != DT_NULL; ++entry) {
    switch (entry->d_tag) {
    case DT_SYMTAB:
      out.symtab = reinterpret_cast<const ElfW(Sym)*>(dynamic_address(info, entry->d_un.d_ptr));
      break;
    case DT_STRTAB:
      out.strtab = reinterpret_cast<const char*>(dynamic_address(info, entry->d_un.d_ptr));
      break;
    case DT_STRSZ:
      out.strsz = entry->d_un.d_val;
      break;
    case DT_HASH:
      out.sysv_hash = reinterpret_cast<const uint32_t*>(dynamic_address(info, entry->d_un.d_ptr));
      break;
    case DT_GNU_HASH:
      out.gnu_hash = reinterpret_cast<const uint32_t*>(dynamic_address(info, entry->d_un.d_ptr));
      break;
    default:
      break;
    }
  }
  return out.symtab != nullptr && out.strtab != nullptr;
}

// the gnu hash table only covers the exported tail of the symbol table; the last chain bounds it
size_t gnu_hash_symbol_count(const uint32_t* table) {
  const uint32_t nbuckets = table[0];
  const uint32_t symoffset = table[1];
  const uint32_t bloom_size = table[2];
  const auto* buckets = reinterpret_cast<const uint32_t*>(
      reinterpret_cast<const ElfW(Addr)*>(table + 4) + bloom_size
  );
  const uint32_t* chains = buckets + nbuckets;

  uint32_t last = 0;
  for (uint32_t i = 0; i < nbuckets; ++i) {
    last = std::max(last, buckets[i]);
  }
  if (last < symoffset) {
    return symoffset;
  }
  while ((chains[last - symoffset] & 1u) == 0) {
    ++last;
  }
  return static_cast<size_t>(last) + 1;
}

size_t symbol_count(const dynamic_tables& tables) {
  if (tables.gnu_hash) {
    return gnu_hash_symbol_count(tables.gnu_hash);
  }
  if (tables.sysv_hash) {
    // nchain equals the number of symbol table entries
    return tables.sysv_hash[1];
  }
  return 0;
}

bool is_exported(const ElfW(Sym)& sym, export_kind& kind) {
  if (sym.st_shndx == SHN_UNDEF || sym.st_name == 0) {
    return false;
  }
  const unsigned bind = ELF64_ST_BIND(sym.st_info);
  if (bind != STB_GLOBAL && bind != STB_WEAK && bind != STB_GNU_UNIQUE) {
    return false;
  }
  const unsigned visibility = ELF64_ST_VISIBILITY(sym.st_other);
  if (visibility == STV_HIDDEN || visibility == STV_INTERNAL) {
    return false;
  }
  switch (ELF64_ST_TYPE(sym.st_info)) {
  case STT_FUNC:
  case STT_GNU_IFUNC:
    kind = export_kind::function;
    return true;
  case STT_OBJECT:
  case STT_COMMON:
  case STT_TLS:
    kind = export_kind::object;
    return true;
  default:
    return false;
  }
}

template <typename Visitor> void for_each_export(const dl_phdr_info* info, Visitor&& visitor) {
  dynamic_tables tables{};
  if (!read_dynamic_tables(info, tables)) {
    return;
  }
  const size_t count = symbol_count(tables);
  for (size_t i = 0; i < count; ++i) {
    const ElfW(Sym)& sym = tables.symtab[i];
    export_kind kind = export_kind::function;
    if (!is_exported(sym, kind)) {
      continue;
    }
    if (tables.strsz != 0 && sym.st_name >= tables.strsz) {
      continue;
    }
    const char* name = tables.strtab + sym.st_name;
    void* address = reinterpret_cast<void*>(static_cast<uintptr_t>(info->dlpi_addr) + sym.st_value);
    if (visitor(name, address, static_cast<size_t>(sym.st_size), kind)) {
      return;
    }
  }
}

} // namespace

std::vector<module_info> enumerate_modules() {
  std::vector<module_info> modules;
  for_each_object([&](const elf_module_snapshot& snapshot) {
    modules.push_back(snapshot.module);
    return false;
  });
  return modules;
}

std::optional<module_info> main_module() { return find_module(nullptr); }

std::optional<module_info> find_module(const char* module) {
  std::optional<module_info> found;
  for_each_object([&](const elf_module_snapshot& snapshot) {
    if (!module_matches(module, snapshot.module)) {
      return false;
    }
    found = snapshot.module;
    return true;
  });
  return found;
}

std::vector<export_symbol> enumerate_exports(const module_info& module) {
  std::vector<export_symbol> exports;
  for_each_object([&](const elf_module_snapshot& snapshot) {
    if (snapshot.module.base != module.base) {
      return false;
    }
    for_each_export(snapshot.info, [&](const char* name, void* address, size_t size, export_kind kind) {
      exports.push_back(export_symbol{name, address, size, kind});
      return false;
    });
    return true;
  });
  return exports;
}

symbol_resolution find_export(const char* symbol, const char* module) {
  symbol_resolution result{};
  if (!symbol || symbol[0] == '\0') {
    result.error = make_error(hook_error::invalid_target, "missing_symbol");
    return result;
  }

  bool module_found = false;
  for_each_object([&](const elf_module_snapshot& snapshot) {
    if (!module_matches(module, snapshot.module)) {
      return false;
    }
    module_found = true;
    for_each_export(snapshot.info, [&](const char* name, void* address, size_t, export_kind) {
      if (std::strcmp(name, symbol) != 0) {
        return false;
      }
      result.address = address;
      return true;
    });
    if (result.address) {
      result.module = snapshot.module;
      return true;
    }
    return false;
  });

  if (result.address) {
    result.error = make_error(hook_error::ok, nullptr);
  } else if (!module_found) {
    result.error = make_error(hook_error::not_found, "module_not_found");
  } else {
    result.error = make_error(hook_error::not_found, "symbol_not_found");
  }
  return result;
}

symbol_resolution resolve_symbol(const char* symbol, const char* module) {
  symbol_resolution result{};
  if (!symbol || symbol[0] == '\0') {
    result.error = make_error(hook_error::invalid_target, "missing_symbol");
    return result;
  }

  void* handle = RTLD_DEFAULT;
  if (module && module[0] != '\0') {
    auto found = find_module(module);
    if (!found) {
      result.error = make_error(hook_error::not_found, "module_not_found");
      return result;
    }
    handle = dlopen(found->path.c_str(), RTLD_LAZY | RTLD_NOLOAD);
    if (!handle) {
      return find_export(symbol, module);
    }
  }

  void* address = dlsym(handle, symbol);
  if (handle != RTLD_DEFAULT) {
    dlclose(handle);
  }
  if (!address) {
    return find_export(symbol, module);
  }

  result.address = address;
  result.error = make_error(hook_error::ok, nullptr);
  Dl_info info{};
  if (dladdr(address, &info) != 0 && info.dli_fname) {
    result.module.base = info.dli_fbase;
    result.module.path = info.dli_fname;
  }
  return result;
}

void* symbol_address(const char* symbol, const char* module) { return resolve_symbol(symbol, module).address; }

} // namespace l1::h00k::resolve
