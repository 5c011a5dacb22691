#include "l1bridge/loader_bridge.hpp"

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

#include "l1bridge/entry_points.hpp"
#include "l1bridge/string_reader.hpp"

namespace l1::bridge {

namespace {

// the host callback carries no user data, so the collection in flight is tracked per thread
struct collect_context {
  decode_limits limits{};
  std::vector<mapped_library> libraries;
  bridge_status status{};
  size_t calls = 0;
};

thread_local collect_context* t_active_collect = nullptr;

using host_record_callback = void (*)(const void* records, size_t count);
using host_iter_fn = void (*)(host_record_callback callback);

void collect_records(const void* records, size_t count) {
  collect_context* context = t_active_collect;
  if (!context) {
    return;
  }

  context->calls += 1;
  if (!context->status.ok()) {
    return;
  }

  auto decoded = decode_records(records, count, context->limits);
  if (!decoded.status.ok()) {
    context->libraries.clear();
    context->status = decoded.status;
    return;
  }

  for (auto& library : decoded.libraries) {
    context->libraries.push_back(std::move(library));
  }
}

const char* module_label(const std::string& module) { return module.empty() ? "<main>" : module.c_str(); }

} // namespace

loader_bridge::loader_bridge() = default;

loader_bridge::~loader_bridge() { shutdown(); }

bridge_status loader_bridge::setup(const bridge_config& config) {
  if (initialized_) {
    log_.dbg("bridge already initialized, ignoring setup");
    return {};
  }

  config_ = config;
  limits_.max_records = config.max_records;
  limits_.max_name_length = config.max_name_length;
  diagnostics_.clear();
  initialized_ = true;

  log_.vrb(
      "setting up loader bridge", redlog::field("iter_symbol", config_.iter_symbol),
      redlog::field("loaded_symbol", config_.loaded_symbol), redlog::field("module", module_label(config_.module))
  );

  bridge_status status{};

  iter_entry_ = find_entry_point(config_.iter_symbol.c_str(), config_.module.c_str());
  if (!iter_entry_) {
    add_diagnostic(capability::enumerate, "entry point not found: " + config_.iter_symbol);
    status = {bridge_error::capability_unavailable, "enumeration entry point not found"};
  }

  loaded_entry_ = find_entry_point(config_.loaded_symbol.c_str(), config_.module.c_str());
  if (!loaded_entry_) {
    add_diagnostic(capability::load_events, "entry point not found: " + config_.loaded_symbol);
    if (status.ok()) {
      status = {bridge_error::capability_unavailable, "load event entry point not found"};
    }
  } else {
    auto hook_status = install_load_hook();
    if (!hook_status.ok() && status.ok()) {
      status = hook_status;
    }
  }

  log_.inf(
      "loader bridge ready", redlog::field("enumerate", available(capability::enumerate) ? "yes" : "no"),
      redlog::field("load_events", available(capability::load_events) ? "yes" : "no")
  );
  return status;
}

bridge_status loader_bridge::install_load_hook() {
  h00k::hook_request request{};
  request.target.kind = h00k::hook_target_kind::address;
  request.target.address = loaded_entry_->address;
  request.prehook = &loader_bridge::on_library_loaded;
  request.user_data = this;

  auto result = h00k::attach(request, nullptr);
  if (!result.error.ok()) {
    std::string message = "failed to instrument " + config_.loaded_symbol + ": " + h00k::to_string(result.error.code);
    if (result.error.detail) {
      message += " (";
      message += result.error.detail;
      message += ")";
    }
    add_diagnostic(capability::load_events, std::move(message));
    return {bridge_error::hook_failed, h00k::to_string(result.error.code)};
  }

  load_hook_ = result.handle;
  load_events_ready_ = true;
  log_.vrb(
      "load event hook installed", redlog::field("symbol", config_.loaded_symbol),
      redlog::field("address", "0x%016lx", reinterpret_cast<uintptr_t>(loaded_entry_->address))
  );
  return {};
}

void loader_bridge::shutdown() {
  if (!initialized_) {
    return;
  }

  if (load_hook_.valid()) {
    auto error = h00k::detach(load_hook_);
    if (error != h00k::hook_error::ok) {
      log_.wrn("failed to remove load event hook", redlog::field("error", h00k::to_string(error)));
    } else {
      log_.vrb("load event hook removed");
    }
  }

  load_hook_ = {};
  load_events_ready_ = false;
  iter_entry_.reset();
  loaded_entry_.reset();
  diagnostics_.clear();
  initialized_ = false;
}

mapped_libs_result loader_bridge::get_mapped_libs() const {
  mapped_libs_result result;
  if (!available(capability::enumerate)) {
    result.status = {bridge_error::capability_unavailable, "enumeration entry point not available"};
    return result;
  }

  collect_context context;
  context.limits = limits_;

  collect_context* previous = t_active_collect;
  t_active_collect = &context;
  auto iter = reinterpret_cast<host_iter_fn>(iter_entry_->address);
  iter(&collect_records);
  t_active_collect = previous;

  if (!context.status.ok()) {
    log_.wrn(
        "host reported invalid records", redlog::field("error", to_string(context.status.code)),
        redlog::field("detail", context.status.detail ? context.status.detail : "")
    );
    result.status = context.status;
    return result;
  }
  if (context.calls == 0) {
    log_.dbg("host never invoked the enumeration callback");
  }

  log_.trc("enumerated mapped libraries", redlog::field("count", context.libraries.size()));
  result.libraries = std::move(context.libraries);
  return result;
}

bool loader_bridge::available(capability which) const {
  if (!initialized_) {
    return false;
  }
  switch (which) {
  case capability::enumerate:
    return iter_entry_.has_value();
  case capability::load_events:
    return load_events_ready_;
  }
  return false;
}

const std::optional<entry_point>& loader_bridge::entry(capability which) const {
  return which == capability::enumerate ? iter_entry_ : loaded_entry_;
}

void loader_bridge::add_diagnostic(capability which, std::string message) {
  log_.err("capability unavailable", redlog::field("capability", to_string(which)), redlog::field("reason", message));
  diagnostics_.push_back({which, std::move(message)});
}

void loader_bridge::on_library_loaded(h00k::hook_info* info) {
  if (!info || !info->user_data || !info->args) {
    return;
  }
  auto* self = static_cast<loader_bridge*>(info->user_data);

  auto* base_slot = static_cast<const uint64_t*>(h00k::arg_get_int_reg_addr(info->args, 0));
  auto* name_slot = static_cast<const uintptr_t*>(h00k::arg_get_int_reg_addr(info->args, 1));
  if (!base_slot || !name_slot) {
    return;
  }

  // the instrumentation stub has no unwind info, nothing may propagate back into the host loader
  try {
    library_load_event event;
    event.base_address = *base_slot;
    if (auto name = read_c_string(reinterpret_cast<const void*>(*name_slot), self->limits_.max_name_length)) {
      event.name = std::move(*name);
    }

    self->log_.dbg(
        "library load announced", redlog::field("base", "0x%016lx", event.base_address),
        redlog::field("name", event.name)
    );

    if (!self->observer_.notify(event)) {
      self->log_.ped("no observer registered, dropping load event");
    }
  } catch (const std::exception& e) {
    self->log_.err("exception while forwarding load event", redlog::field("what", e.what()));
  }
}

} // namespace l1::bridge
