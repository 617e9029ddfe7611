//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/Diagnostic.hpp"

namespace cnc::translator {

    ErrorPolicy errorPolicyFromString(const std::string &name) {
        if (name == "continue") return ErrorPolicy::Continue;
        if (name == "abort") return ErrorPolicy::Abort;
        throw core::types::ConfigException("Unknown error policy: '" + name + "' (expected 'continue' or 'abort')");
    }

    std::string errorPolicyToString(ErrorPolicy policy) {
        return policy == ErrorPolicy::Abort ? "abort" : "continue";
    }

} // namespace cnc::translator
