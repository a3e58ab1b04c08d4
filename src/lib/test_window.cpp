#include "subsequent.hpp"
#include "window.hpp"
#include <cassert>
#include <stdexcept>

using matching::MatchVector;
using matching::Window;
using Windows = std::vector<Window>;
using Indices = std::vector<size_t>;

int main() {
    // windows_around
    {
        const MatchVector m = {false, true, false, false, true, false};
        assert(matching::windows_around(m, 1, 1) == (Windows{{0, 1, 2}, {3, 4, 5}}));
        assert(matching::windows_around(m, 0, 0) == (Windows{{1}, {4}}));
        assert(matching::windows_around(m, 2, 0) == (Windows{{0, 1}, {2, 3, 4}}));
        // overlapping windows are kept as they are
        assert(matching::windows_around(m, 2, 2) ==
               (Windows{{0, 1, 2, 3}, {2, 3, 4, 5}}));
        // clipped to the bounds
        assert(matching::windows_around({true}, 5, 5) == (Windows{{0}}));
        assert(matching::windows_around({}, 1, 1).empty());
        assert(matching::windows_around({false, false}, 1, 1).empty());
    }

    // flat_windows_around and window_mask
    {
        const MatchVector m = {false, true, false, false, true, false};
        assert(matching::flat_windows_around(m, 2, 2) == (Indices{0, 1, 2, 3, 4, 5}));
        assert(matching::flat_windows_around(m, 2, 2, false) ==
               (Indices{0, 1, 2, 3, 2, 3, 4, 5}));
        assert(matching::flat_windows_around(m, 0, 1) == (Indices{1, 2, 4, 5}));
        assert(matching::flat_windows_around({}, 1, 1).empty());

        assert(matching::window_mask(m, 0, 1) ==
               (MatchVector{false, true, true, false, true, true}));
        assert(matching::window_mask({false, false}, 3, 3) ==
               (MatchVector{false, false}));
    }

    // Negative context sizes
    {
        bool thrown = false;
        try {
            matching::windows_around({true}, -1, 0);
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            matching::window_mask({true}, 0, -2);
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);
    }

    // match_subsequent
    {
        const std::vector<std::string> tokens = {"hello", "world", "means",
                                                 "saying", "hello", "world", "."};
        assert(matching::match_subsequent({"hello", "world"}, tokens) ==
               (Windows{{0, 1}, {4, 5}}));
        assert(matching::match_subsequent({"world", "hello"}, tokens).empty());
        assert(matching::match_subsequent({"world", "."}, tokens) == (Windows{{5, 6}}));

        matching::MatchOptions glob;
        glob.type = matching::MatchType::Glob;
        assert(matching::match_subsequent({"world", "*"}, tokens, glob) ==
               (Windows{{1, 2}, {5, 6}}));
        assert(matching::match_subsequent({"hello", "world", "*"}, tokens, glob) ==
               (Windows{{0, 1, 2}, {4, 5, 6}}));

        const std::vector<std::string> colors = {"green", "test", "x",
                                                 "y", "greenish", "tester", "z"};
        assert(matching::match_subsequent({"green*", "test*"}, colors, glob) ==
               (Windows{{0, 1}, {4, 5}}));
        assert(matching::match_subsequent({"green*", "test*", "*"}, colors, glob) ==
               (Windows{{0, 1, 2}, {4, 5, 6}}));

        const std::vector<std::string> mixed = {"green", "test", "emob", "test",
                                                "greener", "tests", "test", "test"};
        assert(matching::match_subsequent({"green*", "test*"}, mixed, glob) ==
               (Windows{{0, 1}, {4, 5}}));

        // runs of repeated tokens may overlap
        assert(matching::match_subsequent({"a", "a"}, {"a", "a", "a"}) ==
               (Windows{{0, 1}, {1, 2}}));

        assert(matching::match_subsequent({"a", "b"}, {}).empty());
        assert(matching::match_subsequent({"a", "b"}, {"a"}).empty());

        bool thrown = false;
        try {
            matching::match_subsequent({"hello"}, tokens);
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);
    }

    return 0;
}
