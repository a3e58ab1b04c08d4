#include "config.hpp"
#include <stdexcept>

namespace {

template <typename T> T get(const YAML::Node &node, const std::string &key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception &e) {
        throw std::invalid_argument("invalid value for '" + key + "': " + e.what());
    }
}

long get_size(const YAML::Node &node, const std::string &key) {
    const long v = get<long>(node, key);
    if (v < 0) throw std::invalid_argument("'" + key + "' must be >= 0");
    return v;
}

void read_matching(const YAML::Node &node, matching::MatchOptions &opts) {
    if (!node) return;
    if (node["type"]) {
        try {
            opts.type = matching::parse_match_type(
                get<std::string>(node["type"], "matching.type"));
        } catch (const std::invalid_argument &e) {
            throw std::invalid_argument(std::string("matching.type: ") + e.what());
        }
    }
    if (node["ignore_case"]) {
        opts.ignore_case = get<bool>(node["ignore_case"], "matching.ignore_case");
    }
    if (node["glob_method"]) {
        try {
            opts.glob_method = matching::parse_glob_method(
                get<std::string>(node["glob_method"], "matching.glob_method"));
        } catch (const std::invalid_argument &e) {
            throw std::invalid_argument(std::string("matching.glob_method: ") + e.what());
        }
    }
}

void read_kwic(const YAML::Node &node, config::Options &opts) {
    if (!node) return;
    if (const auto cs = node["context_size"]) {
        if (cs.IsSequence()) {
            if (cs.size() != 2) {
                throw std::invalid_argument(
                    "'kwic.context_size' must be an integer or a [left, right] pair");
            }
            opts.kwic.left = get_size(cs[0], "kwic.context_size");
            opts.kwic.right = get_size(cs[1], "kwic.context_size");
        } else {
            opts.kwic.left = opts.kwic.right = get_size(cs, "kwic.context_size");
        }
    }
    if (node["highlight_keyword"]) {
        opts.kwic.highlight_keyword =
            get<std::string>(node["highlight_keyword"], "kwic.highlight_keyword");
    }
    if (node["glue"]) {
        opts.kwic_glue = get<std::string>(node["glue"], "kwic.glue");
    }
}

void read_compounds(const YAML::Node &node, text::CompoundOptions &opts) {
    if (!node) return;
    if (node["split_chars"]) {
        opts.split_chars = get<std::vector<std::string>>(node["split_chars"],
                                                         "compounds.split_chars");
    }
    if (const auto len = node["split_on_len"]) {
        if (len.IsNull()) {
            opts.split_on_len = std::nullopt;
        } else {
            const long v = get<long>(len, "compounds.split_on_len");
            if (v < 1) {
                throw std::invalid_argument("'compounds.split_on_len' must be >= 1");
            }
            opts.split_on_len = static_cast<size_t>(v);
        }
    }
    if (node["split_on_casechange"]) {
        opts.split_on_casechange =
            get<bool>(node["split_on_casechange"], "compounds.split_on_casechange");
    }
}

} // namespace

namespace config {

Options from_yaml(const YAML::Node &node) {
    Options opts;
    if (!node || node.IsNull()) return opts;
    if (!node.IsMap()) {
        throw std::invalid_argument("options must be a YAML mapping");
    }

    read_matching(node["matching"], opts.matching);
    read_kwic(node["kwic"], opts);
    read_compounds(node["compounds"], opts.compounds);

    // KWIC searches use the global matching options
    opts.kwic.match = opts.matching;

    if (node["glue"]) opts.glue = get<std::string>(node["glue"], "glue");
    if (node["workers"]) {
        const long w = get<long>(node["workers"], "workers");
        if (w < 1) throw std::invalid_argument("'workers' must be >= 1");
        opts.workers = static_cast<size_t>(w);
    }
    if (node["verbose"]) opts.verbose = get<bool>(node["verbose"], "verbose");
    return opts;
}

Options load(const std::string &path) {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        throw std::runtime_error("cannot read config file '" + path + "'");
    } catch (const YAML::ParserException &e) {
        throw std::runtime_error("cannot parse config file '" + path + "': " + e.what());
    }
    return from_yaml(node);
}

corpus::Context context(const Options &options, const corpus::Pipeline *pipeline) {
    corpus::Context ctx;
    ctx.pipeline = pipeline;
    ctx.workers = options.workers;
    ctx.verbose = options.verbose;
    return ctx;
}

} // namespace config
