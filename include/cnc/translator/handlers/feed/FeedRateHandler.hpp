//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/handlers/BaseCommandHandler.hpp"

namespace cnc::translator::handlers {

    // Stand-alone F word
    class FeedRateHandler : public BaseCommandHandler {
    public:
        FeedRateHandler();

        void apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const override;
    };

} // namespace cnc::translator::handlers
