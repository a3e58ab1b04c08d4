#include "lib/corpus.hpp"
#include "lib/filters.hpp"
#include "lib/glue.hpp"
#include "lib/kwic.hpp"
#include "lib/matching.hpp"
#include "lib/pipeline.hpp"
#include "lib/subsequent.hpp"
#include "lib/text.hpp"
#include "lib/window.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

PYBIND11_MODULE(tokcorpus_cpp, m) {
    m.doc() = "Python bindings for the C++ token corpus engine";

    // Matching options
    py::enum_<matching::MatchType>(m, "MatchType")
        .value("exact", matching::MatchType::Exact)
        .value("regex", matching::MatchType::Regex)
        .value("glob", matching::MatchType::Glob);

    py::enum_<matching::GlobMethod>(m, "GlobMethod")
        .value("match", matching::GlobMethod::Match)
        .value("search", matching::GlobMethod::Search);

    py::class_<matching::MatchOptions>(m, "MatchOptions")
        .def(py::init<>())
        .def_readwrite("type", &matching::MatchOptions::type)
        .def_readwrite("ignore_case", &matching::MatchOptions::ignore_case)
        .def_readwrite("glob_method", &matching::MatchOptions::glob_method);

    m.def("token_match", &matching::token_match,
          py::arg("pattern"), py::arg("tokens"),
          py::arg("options") = matching::MatchOptions(),
          "Match one pattern against every token");
    m.def("match_any", &matching::match_any,
          py::arg("patterns"), py::arg("tokens"),
          py::arg("options") = matching::MatchOptions(),
          "Match any of the patterns against every token");
    m.def("windows_around", &matching::windows_around,
          py::arg("matches"), py::arg("left"), py::arg("right"));
    m.def("flat_windows_around", &matching::flat_windows_around,
          py::arg("matches"), py::arg("left"), py::arg("right"),
          py::arg("remove_overlaps") = true);
    m.def("match_subsequent", &matching::match_subsequent,
          py::arg("patterns"), py::arg("tokens"),
          py::arg("options") = matching::MatchOptions(),
          "Find runs of subsequent tokens matching the patterns in order");

    // Compound splitting
    py::class_<text::CompoundOptions>(m, "CompoundOptions")
        .def(py::init<>())
        .def_readwrite("split_chars", &text::CompoundOptions::split_chars)
        .def_readwrite("split_on_len", &text::CompoundOptions::split_on_len)
        .def_readwrite("split_on_casechange", &text::CompoundOptions::split_on_casechange);

    m.def("shape_split", &text::shape_split,
          py::arg("s"), py::arg("min_part_length") = 2);
    m.def("split_compound",
          py::overload_cast<const std::string &, const std::vector<std::string> &,
                            std::optional<size_t>, bool>(&text::split_compound),
          py::arg("token"), py::arg("split_chars") = std::vector<std::string>{"-"},
          py::arg("split_on_len") = 2, py::arg("split_on_casechange") = false);

    // Documents
    py::register_exception<corpus::ShapeError>(m, "ShapeError", PyExc_ValueError);

    py::class_<corpus::Attributes>(m, "Attributes")
        .def(py::init<>())
        .def_readwrite("is_punct", &corpus::Attributes::is_punct)
        .def_readwrite("lemma", &corpus::Attributes::lemma)
        .def_readwrite("like_num", &corpus::Attributes::like_num)
        .def_readwrite("pos", &corpus::Attributes::pos)
        .def_readwrite("whitespace", &corpus::Attributes::whitespace)
        .def_readwrite("custom", &corpus::Attributes::custom)
        .def("names", &corpus::Attributes::names);

    py::class_<corpus::Document>(m, "Document")
        .def(py::init<std::string, corpus::TokenList, corpus::Attributes>(),
             py::arg("label"), py::arg("tokens") = corpus::TokenList(),
             py::arg("attrs") = corpus::Attributes())
        .def_property_readonly("label", &corpus::Document::label)
        .def_property_readonly("tokens", &corpus::Document::tokens)
        .def_property_readonly("mask", &corpus::Document::mask)
        .def_property_readonly("attrs", &corpus::Document::attrs)
        .def("__len__", &corpus::Document::logical_size)
        .def("logical_tokens", &corpus::Document::logical_tokens)
        .def("logical_attr", &corpus::Document::logical_attr)
        .def("is_compact", &corpus::Document::is_compact)
        .def("apply_mask", &corpus::Document::apply_mask,
             py::arg("submask"), py::arg("invert") = false)
        .def("compact", &corpus::Document::compact);

    py::class_<corpus::Collection>(m, "Collection")
        .def(py::init<>())
        .def(py::init<std::vector<corpus::Document>>())
        .def("add", &corpus::Collection::add)
        .def("replace", &corpus::Collection::replace)
        .def("__len__", &corpus::Collection::size)
        .def("__getitem__",
             py::overload_cast<const std::string &>(&corpus::Collection::at),
             py::return_value_policy::reference_internal)
        .def("__contains__", &corpus::Collection::contains)
        .def("documents", &corpus::Collection::documents);

    py::class_<corpus::Pipeline>(m, "Pipeline");
    py::class_<corpus::WhitespacePipeline, corpus::Pipeline>(m, "WhitespacePipeline")
        .def(py::init<>())
        .def("process", &corpus::WhitespacePipeline::process);

    py::class_<corpus::Context>(m, "Context")
        .def(py::init<>())
        .def_readwrite("workers", &corpus::Context::workers)
        .def_readwrite("verbose", &corpus::Context::verbose);

    m.def("tokenize",
          [](const std::vector<std::string> &texts, const corpus::Pipeline &pipeline,
             const std::vector<std::string> &labels, corpus::Context ctx) {
              ctx.pipeline = &pipeline;
              return corpus::tokenize(texts, ctx, labels);
          },
          py::arg("texts"), py::arg("pipeline"),
          py::arg("labels") = std::vector<std::string>(),
          py::arg("ctx") = corpus::Context());

    // Corpus operations
    m.def("vocabulary", &corpus::vocabulary, py::arg("docs"), py::arg("sort") = false);
    m.def("doc_frequencies", &corpus::doc_frequencies);
    m.def("ngrams", &corpus::ngrams_joined, py::arg("docs"), py::arg("n"),
          py::arg("join_str") = " ");
    m.def("compact_documents", &corpus::compact_documents,
          py::arg("docs"), py::arg("ctx") = corpus::Context());

    // Filters
    m.def("filter_tokens", &corpus::filter_tokens,
          py::arg("docs"), py::arg("patterns"),
          py::arg("options") = matching::MatchOptions(),
          py::arg("inverse") = false, py::arg("by_attr") = "");
    m.def("filter_documents", &corpus::filter_documents,
          py::arg("docs"), py::arg("patterns"),
          py::arg("options") = matching::MatchOptions(),
          py::arg("matches_threshold") = 1, py::arg("inverse_result") = false,
          py::arg("inverse_matches") = false, py::arg("by_attr") = "");
    m.def("remove_common_tokens", &corpus::remove_common_tokens,
          py::arg("docs"), py::arg("df_threshold") = 0.95,
          py::arg("absolute") = false);
    m.def("remove_uncommon_tokens", &corpus::remove_uncommon_tokens,
          py::arg("docs"), py::arg("df_threshold") = 0.05,
          py::arg("absolute") = false);

    // KWIC
    py::class_<corpus::KwicOptions>(m, "KwicOptions")
        .def(py::init<>())
        .def_readwrite("left", &corpus::KwicOptions::left)
        .def_readwrite("right", &corpus::KwicOptions::right)
        .def_readwrite("match", &corpus::KwicOptions::match)
        .def_readwrite("inverse", &corpus::KwicOptions::inverse)
        .def_readwrite("highlight_keyword", &corpus::KwicOptions::highlight_keyword)
        .def_readwrite("non_empty", &corpus::KwicOptions::non_empty);

    m.def("kwic_table_json",
          [](const corpus::Collection &docs, const std::vector<std::string> &patterns,
             const corpus::KwicOptions &options, std::optional<std::string> glue) {
              return corpus::table_to_json(
                         corpus::kwic_table(docs, patterns, options, glue))
                  .dump();
          },
          py::arg("docs"), py::arg("patterns"),
          py::arg("options") = corpus::KwicOptions(),
          py::arg("glue") = py::none(),
          "KWIC table serialized as a JSON array of rows");

    // Gluing
    m.def("glue_tokens",
          [](const corpus::Collection &docs, const std::vector<std::string> &patterns,
             const std::string &glue, const matching::MatchOptions &options) {
              auto r = corpus::glue_tokens(docs, patterns, glue, options);
              return py::make_tuple(std::move(r.docs), std::move(r.glued));
          },
          py::arg("docs"), py::arg("patterns"), py::arg("glue") = "_",
          py::arg("options") = matching::MatchOptions());
    m.def("expand_compounds",
          [](const corpus::Collection &docs, const text::CompoundOptions &options) {
              return corpus::expand_compounds(docs, options);
          },
          py::arg("docs"), py::arg("options") = text::CompoundOptions());
}
