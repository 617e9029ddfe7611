//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/model/CommandCode.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"

namespace cnc::translator {

    std::string CommandCode::toString() const {
        if (!text.empty()) {
            return text;
        }
        return std::string(1, letter) + core::utils::formatFloat(number);
    }

    std::string CommandCode::valueText() const {
        if (text.size() > 1) {
            return text.substr(1);
        }
        return core::utils::formatFloat(number);
    }

} // namespace cnc::translator
