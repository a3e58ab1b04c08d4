#include "kwic.hpp"
#include <cassert>
#include <stdexcept>

using corpus::Collection;
using corpus::Document;
using corpus::TokenList;

namespace {

Collection make_docs() {
    corpus::Attributes attrs;
    attrs.pos = {"PRON", "VERB", "ADP", "PROPN", "PROPN", "PUNCT"};
    attrs.is_punct = {false, false, false, false, false, true};
    attrs.custom["ent"] = {"", "", "", "GPE", "GPE", ""};

    Collection docs;
    docs.add(Document("d1", {"I", "live", "in", "New", "York", "."}, attrs));
    docs.add(Document("d2", {"nothing", "here"}));
    docs.add(Document("d3", {"in", "and", "out", "in"}));
    return docs;
}

} // namespace

int main() {
    // Windows around each match
    {
        Collection docs;
        docs.add(Document("x", {"I", "live", "in", "New", "York", "."}));
        const auto res = corpus::kwic(docs, {"in"}, corpus::kwic_options(1));
        assert(res.size() == 1);
        assert(res[0].label == "x");
        assert(res[0].windows.size() == 1);
        assert(res[0].windows[0].tokens == (TokenList{"live", "in", "New"}));
        assert(res[0].windows[0].positions == (std::vector<size_t>{1, 2, 3}));
        assert(res[0].windows[0].attrs.empty());
    }

    // Every document gets an entry unless non_empty is set
    {
        const Collection docs = make_docs();
        auto res = corpus::kwic(docs, {"in"}, corpus::kwic_options(1));
        assert(res.size() == 3);
        assert(res[1].windows.empty());
        assert(res[2].windows.size() == 2);
        assert(res[2].windows[0].tokens == (TokenList{"in", "and"}));
        assert(res[2].windows[1].tokens == (TokenList{"out", "in"}));

        corpus::KwicOptions opts = corpus::kwic_options(1);
        opts.non_empty = true;
        res = corpus::kwic(docs, {"in"}, opts);
        assert(res.size() == 2);
        assert(res[0].label == "d1");
        assert(res[1].label == "d3");
    }

    // Asymmetric context, highlighting and inverse matches
    {
        const Collection docs = make_docs();
        corpus::KwicOptions opts;
        opts.left = 0;
        opts.right = 2;
        opts.highlight_keyword = "*";
        opts.match.ignore_case = true;
        const auto res = corpus::kwic(docs, {"new"}, opts);
        assert(res[0].windows.size() == 1);
        assert(res[0].windows[0].tokens == (TokenList{"*New*", "York", "."}));

        corpus::KwicOptions inv = corpus::kwic_options(0);
        inv.inverse = true;
        const auto inverted = corpus::kwic(docs, {"in"}, inv);
        assert(inverted[2].windows.size() == 2);
        assert(inverted[2].windows[0].tokens == (TokenList{"and"}));
        assert(inverted[1].windows.size() == 2);
    }

    // Attributes of the window tokens
    {
        const Collection docs = make_docs();
        corpus::KwicOptions opts = corpus::kwic_options(1);
        opts.with_attrs = true;
        const auto res = corpus::kwic(docs, {"York"}, opts);
        const auto &w = res[0].windows[0];
        assert(w.attrs.size() == 3);
        assert(w.attrs[0].first == "is_punct");
        assert(w.attrs[1].first == "pos");
        assert(w.attrs[2].first == "ent");
        assert(std::get<std::string>(w.attrs[1].second[0]) == "PROPN");
        assert(std::get<bool>(w.attrs[0].second[2]));
    }

    // Windows refer to the live tokens
    {
        Collection docs = make_docs();
        docs[0].apply_mask({false, true, true, true, true, false});
        const auto res = corpus::kwic(docs, {"in"}, corpus::kwic_options(1));
        assert(res[0].windows[0].tokens == (TokenList{"live", "in", "New"}));
        assert(res[0].windows[0].positions == (std::vector<size_t>{0, 1, 2}));
    }

    // Glued windows
    {
        const Collection docs = make_docs();
        corpus::KwicOptions opts = corpus::kwic_options(1);
        opts.highlight_keyword = "*";
        const auto res = corpus::kwic_glued(docs, {"in"}, opts);
        assert(res[0].contexts == (std::vector<std::string>{"live *in* New"}));
        assert(res[1].contexts.empty());
        assert(res[2].contexts == (std::vector<std::string>{"*in* and", "out *in*"}));

        corpus::Context ctx;
        ctx.workers = 3;
        const auto parallel = corpus::kwic_glued(docs, {"in"}, opts, "_", ctx);
        assert(parallel[2].contexts == (std::vector<std::string>{"*in*_and", "out_*in*"}));
    }

    // Tables
    {
        const Collection docs = make_docs();
        corpus::KwicOptions opts = corpus::kwic_options(1);

        const auto glued = corpus::kwic_table(docs, {"in"}, opts, std::string(" "));
        assert(glued.columns == (std::vector<std::string>{"doc", "context", "kwic"}));
        assert(glued.rows.size() == 3);
        assert(std::get<std::string>(glued.rows[0][0]) == "d1");
        assert(std::get<size_t>(glued.rows[2][1]) == 1);
        assert(std::get<std::string>(glued.rows[2][2]) == "out in");

        opts.with_attrs = true;
        const auto table = corpus::kwic_table(docs, {"in"}, opts);
        assert(table.columns == (std::vector<std::string>{"doc", "context", "position",
                                                          "token", "is_punct", "pos",
                                                          "ent"}));
        // 3 tokens in d1, 2 + 2 in d3
        assert(table.rows.size() == 7);
        assert(std::get<size_t>(table.rows[1][2]) == 2);
        assert(std::get<std::string>(table.rows[1][3]) == "in");
        assert(std::get<std::string>(table.rows[1][5]) == "ADP");
        assert(std::get<bool>(table.rows[0][4]) == false);
        // d3 has no attributes
        assert(std::get<std::string>(table.rows[3][5]).empty());

        const auto json = corpus::table_to_json(glued);
        assert(json.is_array());
        assert(json.size() == 3);
        assert(json[0]["doc"] == "d1");
        assert(json[0]["context"] == 0);
        assert(json[0]["kwic"] == "live in New");
        assert(json[0].begin().key() == "doc");

        assert(corpus::table_to_json(corpus::kwic_table(docs, {"absent"}, opts)).empty());
    }

    // filter_tokens_with_kwic
    {
        Collection docs = make_docs();
        corpus::filter_tokens_with_kwic(docs, {"York"}, 1, 0);
        assert(docs[0].logical_tokens() == (TokenList{"New", "York"}));
        assert(docs[1].logical_size() == 0);

        Collection removed = make_docs();
        corpus::filter_tokens_with_kwic(removed, {"York"}, 1, 0, {}, true);
        assert(removed[0].logical_tokens() == (TokenList{"I", "live", "in", "."}));
        assert(removed[1].logical_size() == 2);
    }

    // Negative context sizes
    {
        bool thrown = false;
        try {
            corpus::kwic(make_docs(), {"in"}, corpus::kwic_options(-1));
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);
    }

    return 0;
}
