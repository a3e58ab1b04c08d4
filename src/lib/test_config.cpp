#include "config.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace {

bool throws_invalid(const std::string &yaml) {
    try {
        config::from_yaml(YAML::Load(yaml));
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    // Defaults
    {
        const auto opts = config::from_yaml(YAML::Node());
        assert(opts.matching.type == matching::MatchType::Exact);
        assert(!opts.matching.ignore_case);
        assert(opts.kwic.left == 2 && opts.kwic.right == 2);
        assert(!opts.kwic.highlight_keyword);
        assert(!opts.kwic_glue);
        assert(opts.compounds.split_chars == (std::vector<std::string>{"-"}));
        assert(opts.compounds.split_on_len == 2);
        assert(opts.glue == "_");
        assert(opts.workers == 1);
        assert(!opts.verbose);
    }

    // Full document
    {
        const auto opts = config::from_yaml(YAML::Load(R"(
matching:
  type: glob
  ignore_case: true
  glob_method: search
kwic:
  context_size: [1, 3]
  highlight_keyword: "*"
  glue: " "
compounds:
  split_chars: ["-", "/"]
  split_on_len: null
  split_on_casechange: true
glue: "+"
workers: 4
verbose: true
)"));
        assert(opts.matching.type == matching::MatchType::Glob);
        assert(opts.matching.ignore_case);
        assert(opts.matching.glob_method == matching::GlobMethod::Search);
        assert(opts.kwic.left == 1 && opts.kwic.right == 3);
        assert(opts.kwic.match.type == matching::MatchType::Glob);
        assert(*opts.kwic.highlight_keyword == "*");
        assert(*opts.kwic_glue == " ");
        assert(opts.compounds.split_chars == (std::vector<std::string>{"-", "/"}));
        assert(!opts.compounds.split_on_len);
        assert(opts.compounds.split_on_casechange);
        assert(opts.glue == "+");
        assert(opts.workers == 4);
        assert(opts.verbose);

        const auto ctx = config::context(opts);
        assert(ctx.workers == 4);
        assert(ctx.verbose);
        assert(ctx.pipeline == nullptr);
    }

    // Scalar context size
    {
        const auto opts = config::from_yaml(YAML::Load("kwic: {context_size: 5}"));
        assert(opts.kwic.left == 5 && opts.kwic.right == 5);
    }

    // Invalid values
    {
        assert(throws_invalid("matching: {type: fuzzy}"));
        assert(throws_invalid("matching: {glob_method: full}"));
        assert(throws_invalid("matching: {ignore_case: maybe}"));
        assert(throws_invalid("kwic: {context_size: -1}"));
        assert(throws_invalid("kwic: {context_size: [1, 2, 3]}"));
        assert(throws_invalid("compounds: {split_on_len: 0}"));
        assert(throws_invalid("workers: 0"));
        assert(throws_invalid("workers: many"));
        assert(throws_invalid("[1, 2]"));
    }

    // Files
    {
        const std::string path = "/tmp/tokcorpus_test_params.yaml";
        {
            std::ofstream out(path);
            out << "glue: \"-\"\nworkers: 2\n";
        }
        const auto opts = config::load(path);
        assert(opts.glue == "-");
        assert(opts.workers == 2);
        std::remove(path.c_str());

        bool thrown = false;
        try {
            config::load("/tmp/tokcorpus_missing_params.yaml");
        } catch (const std::runtime_error &) {
            thrown = true;
        }
        assert(thrown);
    }

    return 0;
}
