#include "highlighter.h"
#include "file_utils.h"
#include "output_format.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace labshot {

namespace {

struct LanguageRules {
    std::string line_comment;
    std::string block_open;
    std::string block_close;
    bool triple_strings = false;
    bool backtick_strings = false;
    bool preprocessor = false;
    bool tags = false;
    std::set<std::string> keywords;
    std::set<std::string> builtins;
};

const LanguageRules& rules_for(Language language) {
    static const LanguageRules python{
        "#", "", "", true, false, false, false,
        {"False", "None", "True", "and", "as", "assert", "async", "await", "break",
         "class", "continue", "def", "del", "elif", "else", "except", "finally", "for",
         "from", "global", "if", "import", "in", "is", "lambda", "nonlocal", "not", "or",
         "pass", "raise", "return", "try", "while", "with", "yield"},
        {"print", "input", "len", "range", "int", "float", "str", "list", "dict", "set",
         "tuple", "abs", "sum", "min", "max", "sorted", "enumerate", "zip", "map",
         "filter", "type", "isinstance", "round", "bool"}};
    static const LanguageRules c{
        "//", "/*", "*/", false, false, true, false,
        {"auto", "break", "case", "char", "const", "continue", "default", "do", "double",
         "else", "enum", "extern", "float", "for", "goto", "if", "inline", "int", "long",
         "register", "return", "short", "signed", "sizeof", "static", "struct", "switch",
         "typedef", "union", "unsigned", "void", "volatile", "while"},
        {"printf", "scanf", "puts", "putchar", "getchar", "malloc", "calloc", "free",
         "strlen", "strcpy", "strcmp", "strcat", "memset", "memcpy"}};
    static const LanguageRules java{
        "//", "/*", "*/", false, false, false, false,
        {"abstract", "boolean", "break", "byte", "case", "catch", "char", "class",
         "continue", "default", "do", "double", "else", "enum", "extends", "final",
         "finally", "float", "for", "if", "implements", "import", "instanceof", "int",
         "interface", "long", "new", "package", "private", "protected", "public",
         "return", "short", "static", "super", "switch", "this", "throw", "throws",
         "try", "void", "while", "null", "true", "false"},
        {"System", "String", "Math", "Scanner", "Integer", "Double", "ArrayList", "List",
         "HashMap", "Map", "Arrays"}};
    static const LanguageRules script{
        "//", "/*", "*/", false, true, false, false,
        {"async", "await", "break", "case", "catch", "class", "const", "continue",
         "default", "delete", "do", "else", "export", "extends", "false", "finally",
         "for", "from", "function", "if", "import", "in", "instanceof", "let", "new",
         "null", "of", "return", "switch", "this", "throw", "true", "try", "typeof",
         "undefined", "var", "void", "while", "yield"},
        {"console", "Math", "JSON", "Array", "Object", "Promise", "Number", "String",
         "parseInt", "parseFloat", "setTimeout", "require", "module", "process"}};
    static LanguageRules react = [] {
        LanguageRules r = script;
        r.tags = true;
        r.builtins.insert({"React", "useState", "useEffect", "useRef", "useMemo",
                           "document", "window"});
        return r;
    }();
    static const LanguageRules html{
        "", "<!--", "-->", false, false, false, true, {}, {}};

    switch (language) {
        case Language::PYTHON: return python;
        case Language::C: return c;
        case Language::JAVA: return java;
        case Language::JAVASCRIPT: return script;
        case Language::REACT: return react;
        case Language::HTML: return html;
    }
    return python;
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

void push(TokenLine& line, TokenType type, const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (!line.empty() && line.back().type == type) {
        line.back().text += text;
    } else {
        line.push_back({text, type});
    }
}

bool starts_with(const std::string& s, size_t pos, const std::string& prefix) {
    return !prefix.empty() && s.compare(pos, prefix.size(), prefix) == 0;
}

} // namespace

std::vector<TokenLine> highlight(const std::string& source, Language language) {
    const LanguageRules& rules = rules_for(language);
    std::vector<TokenLine> result;

    bool in_block = false;
    std::string open_triple;  // Python """ or ''' left open on a previous line

    for (const auto& raw : FileUtils::split_lines(source)) {
        std::string line = expand_tabs(raw);
        TokenLine tokens;
        size_t i = 0;

        if (rules.preprocessor && !in_block) {
            auto first = line.find_first_not_of(' ');
            if (first != std::string::npos && line[first] == '#') {
                push(tokens, TokenType::PREPROCESSOR, line);
                result.push_back(tokens);
                continue;
            }
        }

        while (i < line.size()) {
            if (in_block) {
                auto end = line.find(rules.block_close, i);
                if (end == std::string::npos) {
                    push(tokens, TokenType::COMMENT, line.substr(i));
                    i = line.size();
                } else {
                    push(tokens, TokenType::COMMENT, line.substr(i, end + rules.block_close.size() - i));
                    i = end + rules.block_close.size();
                    in_block = false;
                }
                continue;
            }
            if (!open_triple.empty()) {
                auto end = line.find(open_triple, i);
                if (end == std::string::npos) {
                    push(tokens, TokenType::STRING, line.substr(i));
                    i = line.size();
                } else {
                    push(tokens, TokenType::STRING, line.substr(i, end + 3 - i));
                    i = end + 3;
                    open_triple.clear();
                }
                continue;
            }

            char c = line[i];
            if (starts_with(line, i, rules.line_comment)) {
                push(tokens, TokenType::COMMENT, line.substr(i));
                break;
            }
            if (starts_with(line, i, rules.block_open)) {
                in_block = true;
                push(tokens, TokenType::COMMENT, rules.block_open);
                i += rules.block_open.size();
                continue;
            }
            if (rules.triple_strings && (starts_with(line, i, "\"\"\"") || starts_with(line, i, "'''"))) {
                open_triple = line.substr(i, 3);
                push(tokens, TokenType::STRING, open_triple);
                i += 3;
                continue;
            }
            if (c == '"' || c == '\'' || (c == '`' && rules.backtick_strings)) {
                size_t j = i + 1;
                while (j < line.size() && line[j] != c) {
                    j += line[j] == '\\' ? 2 : 1;
                }
                j = std::min(j + 1, line.size());
                push(tokens, TokenType::STRING, line.substr(i, j - i));
                i = j;
                continue;
            }
            if (rules.tags && c == '<' && i + 1 < line.size() &&
                (std::isalpha(static_cast<unsigned char>(line[i + 1])) || line[i + 1] == '/' ||
                 line[i + 1] == '!')) {
                size_t j = i + 1;
                while (j < line.size() && (is_ident_char(line[j]) || line[j] == '/' ||
                                           line[j] == '!' || line[j] == '-' || line[j] == '.')) {
                    j++;
                }
                push(tokens, TokenType::TAG, line.substr(i, j - i));
                i = j;
                continue;
            }
            if (rules.tags && (c == '>' || (c == '/' && i + 1 < line.size() && line[i + 1] == '>'))) {
                size_t len = c == '>' ? 1 : 2;
                push(tokens, TokenType::TAG, line.substr(i, len));
                i += len;
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) &&
                (i == 0 || !is_ident_char(line[i - 1]))) {
                size_t j = i;
                while (j < line.size() && (std::isalnum(static_cast<unsigned char>(line[j])) || line[j] == '.')) {
                    j++;
                }
                push(tokens, TokenType::NUMBER, line.substr(i, j - i));
                i = j;
                continue;
            }
            if (is_ident_start(c)) {
                size_t j = i;
                while (j < line.size() && is_ident_char(line[j])) {
                    j++;
                }
                std::string word = line.substr(i, j - i);
                TokenType type = TokenType::TEXT;
                if (rules.keywords.count(word)) {
                    type = TokenType::KEYWORD;
                } else if (rules.builtins.count(word)) {
                    type = TokenType::BUILTIN;
                }
                push(tokens, type, word);
                i = j;
                continue;
            }
            push(tokens, TokenType::TEXT, std::string(1, c));
            i++;
        }
        result.push_back(tokens);
    }
    return result;
}

} // namespace labshot
