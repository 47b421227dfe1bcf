/**
 * Token dump: prints the typewriter token stream of a file or stdin.
 * Usage: inkwell-tokens [file]
 */

#include "inkwell/typewriter/directive.hpp"
#include "inkwell/typewriter/tokenizer.hpp"
#include "inkwell/core/logger.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

using namespace inkwell;
using namespace inkwell::typewriter;

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    std::ostringstream buffer;
    if (argc > 1) {
        std::ifstream in(argv[1], std::ios::in | std::ios::binary);
        if (!in) {
            std::cerr << "Error: Cannot open file: " << argv[1] << "\n";
            return 1;
        }
        buffer << in.rdbuf();
    } else {
        buffer << std::cin.rdbuf();
    }

    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize(String(buffer.str()));

    std::cout << "=== Tokens (" << tokens.size() << ") ===\n";
    for (const auto& token : tokens) {
        auto kind = classify_token(token);
        std::cout << token_kind_name(kind) << "\t";

        if (kind == TokenKind::Directive) {
            auto directive = parse_directive(token);
            std::cout << "type=\"" << directive.type.c_str() << "\" value=\"" << directive.value.c_str() << "\"";
        } else if (token == "\n"_s) {
            std::cout << "\\n";
        } else {
            std::cout << token.c_str();
        }
        std::cout << "\n";
    }

    logging::shutdown();
    return 0;
}
