#include "pipeline.hpp"
#include <cassert>
#include <stdexcept>

using corpus::Document;
using corpus::TokenList;

int main() {
    const corpus::WhitespacePipeline pipeline;

    // Whitespace tokenization with attributes
    {
        const Document doc = pipeline.process("t", "  I have 2 cats ,\tyou\nnone !");
        assert(doc.label() == "t");
        assert(doc.tokens() ==
               (TokenList{"I", "have", "2", "cats", ",", "you", "none", "!"}));
        assert(doc.is_compact());
        assert(doc.attrs().lemma == doc.tokens());
        assert(doc.attrs().is_punct ==
               (std::vector<bool>{false, false, false, false, true, false, false, true}));
        assert(doc.attrs().like_num ==
               (std::vector<bool>{false, false, true, false, false, false, false, false}));
        assert(doc.attrs().whitespace ==
               (std::vector<bool>{true, true, true, true, true, true, true, false}));

        const Document trailing = pipeline.process("t", "end. ");
        assert(trailing.tokens() == (TokenList{"end."}));
        assert(trailing.attrs().whitespace == (std::vector<bool>{true}));
        assert(trailing.attrs().is_punct == (std::vector<bool>{false}));

        const Document empty = pipeline.process("e", " \n ");
        assert(empty.size() == 0);
    }

    // Labels
    {
        assert(corpus::format_label("doc-{i1}", 0) == "doc-1");
        assert(corpus::format_label("{i0}/{i1}", 9) == "9/10");
        assert(corpus::format_label("fixed", 3) == "fixed");
    }

    // tokenize
    {
        corpus::Context ctx;
        ctx.pipeline = &pipeline;

        const auto docs = corpus::tokenize({"a b", "c", ""}, ctx);
        assert(corpus::doc_labels(docs) ==
               (std::vector<std::string>{"doc-1", "doc-2", "doc-3"}));
        assert(docs.at("doc-1").tokens() == (TokenList{"a", "b"}));
        assert(docs.at("doc-3").size() == 0);

        ctx.workers = 4;
        const auto named = corpus::tokenize({"x y", "z"}, ctx, {"first", "second"});
        assert(named.at("second").tokens() == (TokenList{"z"}));
        assert(named[0].label() == "first");

        const auto zero = corpus::tokenize({"x", "y"}, ctx, {}, "text{i0}");
        assert(corpus::doc_labels(zero) == (std::vector<std::string>{"text0", "text1"}));

        bool thrown = false;
        try {
            corpus::tokenize({"x"}, corpus::Context());
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            corpus::tokenize({"x", "y"}, ctx, {"only-one"});
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);

        // duplicate labels
        thrown = false;
        try {
            corpus::tokenize({"x", "y"}, ctx, {"same", "same"});
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);
    }

    return 0;
}
