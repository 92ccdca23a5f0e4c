#include "labshot/validator.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace labshot {

namespace {

struct CallRule {
    const char* name;
    const char* why;
};

const std::vector<std::string> kPythonBannedImports = {
    "os", "subprocess", "pathlib", "shutil", "socket", "urllib", "requests",
    "http", "ctypes", "multiprocessing", "importlib"
};

const std::vector<CallRule> kPythonBannedCalls = {
    {"open", "which counts as a file/system operation"},
    {"os.system", "which counts as a file/system operation"},
    {"os.remove", "which counts as a file/system operation"},
    {"os.unlink", "which counts as a file/system operation"},
    {"os.rmdir", "which counts as a file/system operation"},
    {"subprocess.run", "which counts as a file/system operation"},
    {"subprocess.Popen", "which counts as a file/system operation"},
    {"shutil.rmtree", "which counts as a file/system operation"},
    {"exec", "which evaluates code dynamically"},
    {"eval", "which evaluates code dynamically"},
    {"compile", "which evaluates code dynamically"},
    {"__import__", "which imports modules dynamically"},
};

const std::vector<CallRule> kCBannedCalls = {
    {"system", "which spawns a shell"},
    {"popen", "which spawns a shell"},
    {"fork", "which spawns a process"},
    {"vfork", "which spawns a process"},
    {"execl", "which replaces the process image"},
    {"execlp", "which replaces the process image"},
    {"execle", "which replaces the process image"},
    {"execv", "which replaces the process image"},
    {"execvp", "which replaces the process image"},
    {"execve", "which replaces the process image"},
    {"socket", "which opens a network connection"},
    {"connect", "which opens a network connection"},
    {"remove", "which deletes files"},
    {"unlink", "which deletes files"},
    {"rmdir", "which deletes files"},
    {"rename", "which modifies the filesystem"},
    {"getenv", "which reads the environment"},
};

const std::vector<std::string> kCBannedHeaders = {
    "sys/socket.h", "netinet/", "arpa/inet.h", "netdb.h", "sys/ptrace.h"
};

const std::vector<std::pair<std::string, std::string>> kJavaBannedTokens = {
    {"Runtime.getRuntime", "Spawning processes via Runtime is not allowed."},
    {"ProcessBuilder", "Spawning processes via ProcessBuilder is not allowed."},
    {"java.net", "Network access (java.net) is not allowed."},
    {"FileWriter", "Writing files (FileWriter) is not allowed."},
    {"FileOutputStream", "Writing files (FileOutputStream) is not allowed."},
    {"RandomAccessFile", "Writing files (RandomAccessFile) is not allowed."},
    {"Files.write", "Writing files (Files.write) is not allowed."},
    {"Files.delete", "Deleting files (Files.delete) is not allowed."},
    {"Files.newBufferedWriter", "Writing files (Files.newBufferedWriter) is not allowed."},
    {"System.getenv", "Reading the environment (System.getenv) is not allowed."},
    {"Class.forName", "Reflective class loading (Class.forName) is not allowed."},
    {"java.lang.reflect", "Reflection (java.lang.reflect) is not allowed."},
};

const std::vector<std::string> kScriptBannedModules = {
    "child_process", "fs", "fs/promises", "net", "http", "https", "http2",
    "dgram", "tls", "dns", "cluster", "worker_threads", "vm"
};

const std::vector<std::pair<std::string, std::string>> kScriptBannedTokens = {
    {"process.env", "Reading the environment (process.env) is not allowed."},
    {"process.binding", "Native bindings (process.binding) are not allowed."},
    {"XMLHttpRequest", "Network access (XMLHttpRequest) is not allowed."},
    {"WebSocket", "Network access (WebSocket) is not allowed."},
    {"EventSource", "Network access (EventSource) is not allowed."},
    {"navigator.sendBeacon", "Network access (navigator.sendBeacon) is not allowed."},
    {"document.cookie", "Cookie access (document.cookie) is not allowed."},
    {"dangerouslySetInnerHTML", "Raw HTML injection (dangerouslySetInnerHTML) is not allowed."},
};

const std::vector<std::pair<std::string, std::string>> kHtmlBannedTokens = {
    {"<iframe", "Embedding frames (<iframe>) is not allowed."},
    {"<object", "Embedding objects (<object>) is not allowed."},
    {"window.open", "Opening windows (window.open) is not allowed."},
};

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string module_root(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

// Quoted literal starting at pos (which must be a quote); empty if none
std::string quoted_at(const std::string& s, size_t pos) {
    if (pos >= s.size() || (s[pos] != '\'' && s[pos] != '"' && s[pos] != '`')) {
        return "";
    }
    char quote = s[pos];
    auto end = s.find(quote, pos + 1);
    if (end == std::string::npos) {
        return "";
    }
    return s.substr(pos + 1, end - pos - 1);
}

size_t skip_spaces(const std::string& s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
    return pos;
}

ValidationResult call_rejection(const std::string& name, const std::string& why) {
    return ValidationResult::reject(name, "Detected call to '" + name + "', " + why + ".");
}

} // namespace

std::vector<std::string> python_imports(const std::string& source) {
    std::vector<std::string> modules;
    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        std::string stmt = trim(line);
        // Semicolon-joined statements count too
        std::istringstream parts(stmt);
        std::string part;
        while (std::getline(parts, part, ';')) {
            part = trim(part);
            if (part.rfind("import ", 0) == 0) {
                std::istringstream names(part.substr(7));
                std::string name;
                while (std::getline(names, name, ',')) {
                    std::istringstream words(trim(name));
                    std::string word;
                    if (words >> word) {
                        modules.push_back(module_root(word));
                    }
                }
            } else if (part.rfind("from ", 0) == 0) {
                std::istringstream words(part.substr(5));
                std::string word;
                if (words >> word && word[0] != '.') {
                    modules.push_back(module_root(word));
                }
            }
        }
    }
    return modules;
}

std::vector<std::string> script_imports(const std::string& source) {
    std::vector<std::string> modules;
    auto collect = [&](const std::string& marker, bool needs_paren) {
        size_t pos = 0;
        while ((pos = source.find(marker, pos)) != std::string::npos) {
            size_t after = pos + marker.size();
            if (pos > 0 && is_ident_char(source[pos - 1])) {
                pos = after;
                continue;
            }
            size_t q = skip_spaces(source, after);
            if (needs_paren) {
                if (q >= source.size() || source[q] != '(') {
                    pos = after;
                    continue;
                }
                q = skip_spaces(source, q + 1);
            }
            std::string name = quoted_at(source, q);
            if (!name.empty()) {
                if (name.rfind("node:", 0) == 0) {
                    name = name.substr(5);
                }
                modules.push_back(name);
            }
            pos = after;
        }
    };
    collect("require", true);
    collect("import", true);
    collect("from", false);
    // Side-effect imports: import 'x';
    collect("import", false);
    return modules;
}

bool contains_call(const std::string& source, const std::string& name) {
    size_t pos = 0;
    while ((pos = source.find(name, pos)) != std::string::npos) {
        size_t after = pos + name.size();
        bool left_ok = pos == 0 ||
            (!is_ident_char(source[pos - 1]) && source[pos - 1] != '.');
        bool right_ok = after >= source.size() || !is_ident_char(source[after]);
        if (left_ok && right_ok) {
            size_t p = after;
            while (p < source.size() && (source[p] == ' ' || source[p] == '\t')) {
                p++;
            }
            if (p < source.size() && source[p] == '(') {
                return true;
            }
        }
        pos = after;
    }
    return false;
}

CodeValidator::CodeValidator(size_t max_source_length)
    : max_source_length_(max_source_length) {}

ValidationResult CodeValidator::validate(const std::string& source, Language language) const {
    if (trim(source).empty()) {
        return ValidationResult::reject("empty", "No source code was provided.");
    }
    if (source.size() > max_source_length_) {
        return ValidationResult::reject("length",
            "Source is " + std::to_string(source.size()) + " characters; the limit is " +
            std::to_string(max_source_length_) + ".");
    }

    switch (language) {
        case Language::PYTHON:
            return validate_python(source);
        case Language::C:
            return validate_c(source);
        case Language::JAVA:
            return validate_java(source);
        case Language::JAVASCRIPT:
            return validate_script(source, false);
        case Language::REACT:
        case Language::HTML:
            return validate_script(source, true);
    }
    return ValidationResult::ok();
}

ValidationResult CodeValidator::validate_python(const std::string& source) const {
    for (const auto& module : python_imports(source)) {
        if (std::find(kPythonBannedImports.begin(), kPythonBannedImports.end(), module) !=
            kPythonBannedImports.end()) {
            return ValidationResult::reject(module,
                "Importing '" + module + "' is not allowed for lab submissions.");
        }
    }
    for (const auto& rule : kPythonBannedCalls) {
        if (contains_call(source, rule.name)) {
            return call_rejection(rule.name, rule.why);
        }
    }
    if (source.find("__builtins__") != std::string::npos ||
        source.find("__subclasses__") != std::string::npos) {
        return ValidationResult::reject("__builtins__",
            "Introspection of interpreter internals is not allowed.");
    }
    return ValidationResult::ok();
}

ValidationResult CodeValidator::validate_c(const std::string& source) const {
    for (const auto& header : kCBannedHeaders) {
        if (source.find(header) != std::string::npos) {
            return ValidationResult::reject(header,
                "Including <" + header + "> is not allowed for lab submissions.");
        }
    }
    for (const auto& rule : kCBannedCalls) {
        if (contains_call(source, rule.name)) {
            return call_rejection(rule.name, rule.why);
        }
    }

    // fopen is fine for reading; any write/append mode is rejected
    size_t pos = 0;
    while ((pos = source.find("fopen", pos)) != std::string::npos) {
        auto close = source.find(')', pos);
        std::string call = source.substr(pos, close == std::string::npos ? std::string::npos
                                                                         : close - pos);
        auto comma = call.rfind(',');
        if (comma != std::string::npos) {
            std::string mode = quoted_at(call, skip_spaces(call, comma + 1));
            if (mode.find_first_of("wa+") != std::string::npos) {
                return ValidationResult::reject("fopen",
                    "Opening files for writing (fopen mode \"" + mode + "\") is not allowed.");
            }
        }
        pos += 5;
    }
    return ValidationResult::ok();
}

ValidationResult CodeValidator::validate_java(const std::string& source) const {
    for (const auto& [token, reason] : kJavaBannedTokens) {
        if (source.find(token) != std::string::npos) {
            return ValidationResult::reject(token, reason);
        }
    }
    return ValidationResult::ok();
}

ValidationResult CodeValidator::validate_script(const std::string& source, bool markup) const {
    for (const auto& module : script_imports(source)) {
        if (std::find(kScriptBannedModules.begin(), kScriptBannedModules.end(), module) !=
            kScriptBannedModules.end()) {
            return ValidationResult::reject(module,
                "Importing '" + module + "' is not allowed for lab submissions.");
        }
    }
    for (const char* call : {"eval", "Function", "fetch", "importScripts"}) {
        if (contains_call(source, call)) {
            std::string why = std::string(call) == "fetch" ? "which performs network access"
                                                           : "which evaluates code dynamically";
            return call_rejection(call, why);
        }
    }
    for (const auto& [token, reason] : kScriptBannedTokens) {
        if (source.find(token) != std::string::npos) {
            return ValidationResult::reject(token, reason);
        }
    }
    if (markup) {
        for (const auto& [token, reason] : kHtmlBannedTokens) {
            if (source.find(token) != std::string::npos) {
                return ValidationResult::reject(token, reason);
            }
        }
    }
    return ValidationResult::ok();
}

} // namespace labshot
