//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/registry/HandlerRegistry.hpp"
#include "cnc/translator/model/Command.hpp"
#include "cnc/core/state/MachineState.hpp"
#include <cstddef>
#include <memory>

namespace cnc::translator {

    class CommandDispatcher {
    public:
        explicit CommandDispatcher(std::shared_ptr<const HandlerRegistry> registry);

        /**
         * @brief Esegue il comando tramite l'handler registrato per il suo codice.
         * @throws core::types::UnsupportedCommandException se il codice non ha handler (stato invariato).
         * @throws core::types::InvalidParameterException dall'handler.
         */
        void dispatch(const Command &command, core::state::MachineState &state, size_t lineNumber) const;

        const HandlerRegistry &getRegistry() const;

    private:
        std::shared_ptr<const HandlerRegistry> registry_;
    };

} // namespace cnc::translator
