//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/handlers/BaseCommandHandler.hpp"

namespace cnc::translator::handlers {

    /**
     * @brief Parola T (selezione) e M6 (cambio utensile).
     */
    class ToolHandler : public BaseCommandHandler {
    public:
        ToolHandler();

        void apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const override;
    };

} // namespace cnc::translator::handlers
