#pragma once

#include <string>
#include <vector>

#include "labshot/theme.h"

namespace labshot {

enum class TokenType {
    TEXT,
    KEYWORD,
    BUILTIN,
    STRING,
    COMMENT,
    NUMBER,
    PREPROCESSOR,
    TAG
};

struct Token {
    std::string text;
    TokenType type = TokenType::TEXT;
};

using TokenLine = std::vector<Token>;

// Lexical highlighting, one token list per source line. Multi-line
// comments and Python triple-quoted strings carry across lines.
std::vector<TokenLine> highlight(const std::string& source, Language language);

} // namespace labshot
