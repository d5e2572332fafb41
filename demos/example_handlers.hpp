#pragma once

#include <scribe/handlers/handler.hpp>

namespace scribe::examples {

// Registers a small set of Ruby handlers under `family`: module and class
// definitions (including `class << self`), method definitions,
// attr_reader/attr_writer/attr_accessor, public/protected/private,
// constant and class variable assignments.
Status install_example_handlers(HandlerRegistry& registry,
                                const std::string& family = "ruby");

} // namespace scribe::examples
