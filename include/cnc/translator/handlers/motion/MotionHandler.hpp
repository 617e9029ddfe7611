//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/handlers/BaseCommandHandler.hpp"

namespace cnc::translator::handlers {

    /**
     * @brief G0 (rapid) and G1 (linear) moves.
     *
     * Omitted axes keep their value. Targets are absolute or incremental
     * depending on the positioning mode and are converted to millimetres.
     */
    class MotionHandler : public BaseCommandHandler {
    public:
        MotionHandler();

        void apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const override;
    };

} // namespace cnc::translator::handlers
