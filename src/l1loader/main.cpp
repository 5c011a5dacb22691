#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <args.hxx>
#include <redlog.hpp>

#include "l1base/cli/verbosity.hpp"
#include "l1host/entry_points.hpp"
#include "l1host/library_loader.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});
} // namespace cli

namespace {
auto log_main = redlog::get_logger("l1loader");

void print_record_table(const l1::host::library_record* records, size_t count) {
  std::printf("%zu libraries registered\n", count);
  for (size_t i = 0; i < count; ++i) {
    std::printf("  0x%016" PRIx64 "  %s\n", records[i].base_address, records[i].name ? records[i].name : "");
  }
}

} // namespace

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("l1loader - loads shared libraries and announces them to observers");
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Flag list(parser, "list", "print the registry through jni_loader_iter_libs", {'l', "list"});
  args::Flag unload(parser, "unload", "unload every library before exiting instead of leaving it mapped", {"unload"});
  args::ValueFlagList<std::string> library_paths(
      parser, "dir", "search this directory before LD_LIBRARY_PATH and the system paths", {'L', "library-path"}
  );
  args::ValueFlag<int> hold(parser, "ms", "wait this long after loading", {"hold"});
  args::PositionalList<std::string> libraries(parser, "library", "shared libraries to load");

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
    return 0;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  l1::cli::apply_verbosity(args::get(cli::verbosity_flag));

  // libraries stay mapped until exit unless --unload asks for an explicit teardown
  l1::host::library_loader loader(l1::host::library_registry::global(), false);
  const std::vector<std::string> search_paths = args::get(library_paths);
  bool failed = false;

  for (const auto& name : args::get(libraries)) {
    auto result = loader.load(name, search_paths);
    if (!result.ok()) {
      std::cerr << "failed to load " << name << ": " << l1::host::to_string(result.error);
      if (!result.detail.empty()) {
        std::cerr << " (" << result.detail << ")";
      }
      std::cerr << std::endl;
      failed = true;
    }
  }

  if (hold && args::get(hold) > 0) {
    log_main.vrb("holding", redlog::field("ms", args::get(hold)));
    std::this_thread::sleep_for(std::chrono::milliseconds(args::get(hold)));
  }

  if (list) {
    jni_loader_iter_libs(&print_record_table);
  }

  if (unload) {
    loader.unload_all();
    log_main.vrb("unloaded libraries", redlog::field("registered", l1::host::library_registry::global().size()));
  }

  return failed ? 1 : 0;
}
