#include "lib/config.hpp"
#include "lib/kwic.hpp"
#include "lib/pipeline.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <pattern> <text...>" << std::endl;
        std::cerr << "Example: " << argv[0]
                  << " in \"I live in New York .\"" << std::endl;
        return 1;
    }

    try {
        // Load options from params.yaml if present
        config::Options opts;
        if (std::filesystem::exists("params.yaml")) {
            opts = config::load("params.yaml");
        }

        // Concatenate all text arguments (skip program name and pattern)
        std::string input;
        for (int i = 2; i < argc; ++i) {
            if (i > 2) input += " ";
            input += argv[i];
        }

        corpus::WhitespacePipeline pipeline;
        const auto ctx = config::context(opts, &pipeline);
        const auto docs = corpus::tokenize({input}, ctx);

        const auto table =
            corpus::kwic_table(docs, {argv[1]}, opts.kwic, opts.kwic_glue, ctx);
        std::cout << corpus::table_to_json(table).dump(2) << std::endl;
        std::cout << "\nRows: " << table.rows.size() << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
