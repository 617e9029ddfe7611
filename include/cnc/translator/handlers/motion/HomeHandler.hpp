//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/handlers/BaseCommandHandler.hpp"

namespace cnc::translator::handlers {

    // G28: all axes, or only the named ones, return to 0
    class HomeHandler : public BaseCommandHandler {
    public:
        HomeHandler();

        void apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const override;
    };

} // namespace cnc::translator::handlers
