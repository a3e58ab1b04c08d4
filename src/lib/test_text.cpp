#include "text.hpp"
#include <cassert>
#include <stdexcept>

using Parts = std::vector<std::string>;

int main() {
    // Character helpers
    {
        assert(text::char_length("") == 0);
        assert(text::char_length("abc") == 3);
        assert(text::char_length("Äpfel") == 5);
        assert(text::char_length("Δx") == 2);

        assert(text::is_upper("US"));
        assert(text::is_upper("E"));
        assert(text::is_upper("ÄÖ-1"));
        assert(!text::is_upper("Us"));
        assert(!text::is_upper("123"));
        assert(!text::is_upper(""));

        assert(text::to_lower("Hello World") == "hello world");
        assert(text::to_lower("ÄPFEL") == "äpfel");
        assert(text::to_lower("ΔΕΛΤΑ") == "δελτα");
        assert(text::to_lower("МОСКВА") == "москва");
        assert(text::to_lower("") == "");

        // letters outside the common Latin, Greek and Cyrillic blocks
        assert(text::to_lower("Ÿ") == "ÿ");
        assert(text::to_lower("ź") == "ź");
        assert(text::to_lower("VIỆT NAM") == "việt nam");
        assert(text::to_lower("ԲԱՐԵՎ") == "բարեվ");
        assert(!text::is_upper("ǅ"));
        assert(text::is_upper("ƁỆ"));
        assert(!text::is_upper("việt"));
    }

    // str_multisplit
    {
        assert(text::str_multisplit("US-Student", {"-"}) == (Parts{"US", "Student"}));
        assert(text::str_multisplit("a-b--c", {"-"}) == (Parts{"a", "b", "", "c"}));
        assert(text::str_multisplit("abc", {"-"}) == (Parts{"abc"}));
        assert(text::str_multisplit("", {"-"}) == (Parts{""}));
        assert(text::str_multisplit("-main_file.exe,", {"-", "_", ".", ","}) ==
               (Parts{"", "main", "file", "exe", ""}));
        assert(text::str_multisplit("abc", {}) == (Parts{"abc"}));

        bool thrown = false;
        try {
            text::str_multisplit("abc", {""});
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);
    }

    // str_shape
    {
        const auto shape = text::str_shape("eMail");
        assert(shape.size() == 5);
        assert(shape[0] == text::SHAPE_LOWER);
        assert(shape[1] == text::SHAPE_OTHER);
        assert(shape[2] == text::SHAPE_LOWER);
        assert(text::str_shape("").empty());
        assert(text::str_shape("ä1")[0] == text::SHAPE_LOWER);
        assert(text::str_shape("ä1")[1] == text::SHAPE_OTHER);
        assert(text::str_shape("ế")[0] == text::SHAPE_LOWER);
        assert(text::str_shape("ƀ")[0] == text::SHAPE_LOWER);
        assert(text::str_shape("Ế")[0] == text::SHAPE_OTHER);
    }

    // shape_split
    {
        assert(text::shape_split("NewYork") == (Parts{"New", "York"}));
        assert(text::shape_split("newYork") == (Parts{"new", "York"}));
        assert(text::shape_split("USflag") == (Parts{"US", "flag"}));
        assert(text::shape_split("eMail") == (Parts{"eMail"}));
        assert(text::shape_split("foobaR") == (Parts{"foobaR"}));
        assert(text::shape_split("lower") == (Parts{"lower"}));
        assert(text::shape_split("") == (Parts{""}));
        assert(text::shape_split("việtNam") == (Parts{"việt", "Nam"}));
        assert(text::shape_split("nguyễn") == (Parts{"nguyễn"}));

        // the parts always concatenate back to the input
        const Parts inputs{"NewYork", "USflag", "eMail", "aB", "ABCdefGHi",
                           "x", "HTTPServerError", "việtNam", "über-Straße",
                           "a1b2C3", "ΔέλταΩmega", "", "lower", "UPPER"};
        for (const auto &s : inputs) {
            for (size_t min_len = 1; min_len <= 3; ++min_len) {
                std::string joined;
                for (const auto &p : text::shape_split(s, min_len)) joined += p;
                assert(joined == s);
            }
        }

        bool thrown = false;
        try {
            text::shape_split("NewYork", 0);
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);
    }

    // split_compound with the default options
    {
        const Parts dash{"-"};
        assert(text::split_compound("US-Student", dash) == (Parts{"US", "Student"}));
        assert(text::split_compound("US-Student-X", dash) == (Parts{"US", "StudentX"}));
        assert(text::split_compound("Student-X", dash) == (Parts{"StudentX"}));
        assert(text::split_compound("Do-Not-Disturb", dash) ==
               (Parts{"Do", "Not", "Disturb"}));
        assert(text::split_compound("E-Mobility-Strategy", dash) ==
               (Parts{"EMobility", "Strategy"}));
        assert(text::split_compound("Camel-CamelCase", dash) ==
               (Parts{"Camel", "CamelCase"}));
        assert(text::split_compound("nocompound", dash) == (Parts{"nocompound"}));
        assert(text::split_compound("", dash) == (Parts{""}));
        assert(text::split_compound("---", dash) == (Parts{"---"}));
    }

    // split_compound variations
    {
        const Parts dash{"-"};
        assert(text::split_compound("E-Mobility-Strategy", dash, 1) ==
               (Parts{"E", "Mobility", "Strategy"}));
        assert(text::split_compound("Te;s,t", {";", ","}, 1) ==
               (Parts{"Te", "s", "t"}));
        assert(text::split_compound("Camel-CamelCase", dash, 2, true) ==
               (Parts{"Camel", "Camel", "Case"}));
        assert(text::split_compound("Camel-camelCase", dash, 2, true) ==
               (Parts{"Camel", "camel", "Case"}));
        assert(text::split_compound("US-Student", dash, std::nullopt, true) ==
               (Parts{"USStudent"}));

        text::CompoundOptions opts;
        opts.split_chars = {};
        opts.split_on_casechange = true;
        assert(text::split_compound("NewYork", opts) == (Parts{"New", "York"}));

        bool thrown = false;
        try {
            text::split_compound("US-Student", dash, 0);
        } catch (const std::invalid_argument &) {
            thrown = true;
        }
        assert(thrown);
    }

    return 0;
}
