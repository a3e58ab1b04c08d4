#pragma once

#include "corpus.hpp"
#include "kwic.hpp"
#include "matching.hpp"
#include "text.hpp"
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace config {

// Defaults for the option structs of the library, as read from params.yaml:
//
//   matching:  { type: exact|regex|glob, ignore_case: bool, glob_method: match|search }
//   kwic:      { context_size: int | [left, right], highlight_keyword: str, glue: str }
//   compounds: { split_chars: [str], split_on_len: int|null, split_on_casechange: bool }
//   glue: str
//   workers: int
//   verbose: bool
struct Options {
    matching::MatchOptions matching;
    corpus::KwicOptions kwic;
    // joins KWIC windows into single strings when set
    std::optional<std::string> kwic_glue;
    text::CompoundOptions compounds;
    std::string glue = "_";
    size_t workers = 1;
    bool verbose = false;
};

// Missing keys keep their defaults. Invalid values throw
// std::invalid_argument naming the key.
Options from_yaml(const YAML::Node &node);

// Throws std::runtime_error if path cannot be read
Options load(const std::string &path);

// Context for corpus operations using the worker and verbosity settings
corpus::Context context(const Options &options,
                        const corpus::Pipeline *pipeline = nullptr);

} // namespace config
