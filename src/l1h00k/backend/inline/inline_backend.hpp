#pragma once

#include <memory>

#include "l1h00k/backend/backend.hpp"

namespace l1::h00k::backend {

std::unique_ptr<hook_backend> make_inline_instrument_backend();

} // namespace l1::h00k::backend
