#pragma once

#include <string>

namespace labshot {

enum class Language {
    PYTHON,
    C,
    JAVA,
    JAVASCRIPT,
    HTML,
    REACT
};

// One visual template per supported editor/console look
enum class Theme {
    IDLE,
    VSCODE,
    NOTEPAD,
    CODEBLOCKS,
    HTML,
    REACT,
    NODE
};

// Throws std::invalid_argument for an unsupported language name
Language parse_language(const std::string& name);
std::string language_name(Language language);

// Source file extension without the dot
std::string language_extension(Language language);

// HTML and React tasks are rendered, never executed
bool is_executable(Language language);

// Throws UnknownThemeError; never falls back silently
Theme parse_theme(const std::string& name);
std::string theme_name(Theme theme);

Theme default_theme_for(Language language);

// Resolves a batch theme string; "auto" or empty picks the language default
Theme resolve_theme(const std::string& batch_theme, Language language);

// Public class name of a Java source, "Main" when none is declared
std::string java_class_name(const std::string& source);

// File name the snippet is saved and displayed under, e.g. "main.py", "Main.java"
std::string source_filename(Language language, const std::string& source);

// Language implied by a project file path, e.g. "src/App.jsx" -> REACT
Language language_for_path(const std::string& path, Language fallback);

} // namespace labshot
