//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/handlers/BaseCommandHandler.hpp"

namespace cnc::translator::handlers {

    /**
     * @brief M3/M4/M5 e la parola S isolata (velocità mandrino).
     */
    class SpindleHandler : public BaseCommandHandler {
    public:
        SpindleHandler();

        void apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const override;
    };

} // namespace cnc::translator::handlers
