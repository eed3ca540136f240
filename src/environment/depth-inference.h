#pragma once

#include <functional>
#include <optional>
#include <string>

#include "depth.h"

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// std::getenv wrapper, std::nullopt when unset.
std::optional<std::string> process_env(const std::string & name);

// Guess the best depth for the current terminal.
//
// Checks NO_COLOR, COLORTERM and TERM in that order. Returns std::nullopt
// when color should be disabled (NO_COLOR or a dumb terminal).
std::optional<Depth> infer_depth(const EnvLookup & lookup = process_env);
