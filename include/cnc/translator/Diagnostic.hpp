//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/core/types/Error.hpp"
#include <cstddef>
#include <string>

namespace cnc::translator {

    enum class ErrorPolicy {
        Continue, // report and go on with the next line
        Abort     // report and stop at the first error
    };

    // Throws ConfigException for names other than "continue" / "abort"
    ErrorPolicy errorPolicyFromString(const std::string &name);

    std::string errorPolicyToString(ErrorPolicy policy);

    struct InterpreterOptions {
        ErrorPolicy errorPolicy = ErrorPolicy::Continue;
        bool stopAtProgramEnd = true;
        bool requireGcodeExtension = false;
    };

    struct Diagnostic {
        core::types::ErrorKind kind;
        size_t lineNumber; // 0 when not tied to a line
        std::string message;
    };

} // namespace cnc::translator
