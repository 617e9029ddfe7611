//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/model/Command.hpp"
#include "cnc/core/state/MachineState.hpp"
#include <cstddef>

namespace cnc::translator::handlers {

    class ICommandHandler {
    public:
        virtual ~ICommandHandler() = default;

        /**
         * @brief Applica l'effetto del comando sullo stato macchina.
         * @throws core::types::InvalidParameterException per parametri non accettati o fuori range.
         */
        virtual void apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const = 0;
    };

} // namespace cnc::translator::handlers
