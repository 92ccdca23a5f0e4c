#pragma once

#include <string>
#include <vector>

#include "labshot/constants.h"
#include "labshot/theme.h"

namespace labshot {

struct ValidationResult {
    bool accepted = true;
    std::string reason;   // Human readable, empty when accepted
    std::string rule;     // Matched token, e.g. "subprocess" or "fetch"

    static ValidationResult ok() { return {}; }
    static ValidationResult reject(const std::string& rule, const std::string& reason) {
        return {false, reason, rule};
    }
};

// Pattern screen run inline before scheduling. It is a fast-fail for
// obviously disallowed code; isolation is enforced by the executor.
class CodeValidator {
public:
    explicit CodeValidator(size_t max_source_length = MAX_SOURCE_LENGTH);

    // Returns the first matching rejection. No side effects.
    ValidationResult validate(const std::string& source, Language language) const;

private:
    ValidationResult validate_python(const std::string& source) const;
    ValidationResult validate_c(const std::string& source) const;
    ValidationResult validate_java(const std::string& source) const;
    ValidationResult validate_script(const std::string& source, bool markup) const;

    size_t max_source_length_;
};

// Module roots named by Python "import a.b" / "from a import b" lines
std::vector<std::string> python_imports(const std::string& source);

// Module names named by require('x'), import ... from 'x' and import('x')
std::vector<std::string> script_imports(const std::string& source);

// True when `name(` occurs as a call, not as a suffix of a longer identifier
bool contains_call(const std::string& source, const std::string& name);

} // namespace labshot
