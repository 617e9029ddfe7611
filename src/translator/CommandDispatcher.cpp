//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/CommandDispatcher.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/logger/Logger.hpp"
#include <utility>

namespace cnc::translator {

    CommandDispatcher::CommandDispatcher(std::shared_ptr<const HandlerRegistry> registry)
        : registry_(std::move(registry)) {
        if (!registry_) {
            throw core::types::RegistryException("CommandDispatcher requires a handler registry");
        }
    }

    void CommandDispatcher::dispatch(const Command &command, core::state::MachineState &state,
                                     size_t lineNumber) const {
        const std::string code = command.getCode().toString();

        auto handler = registry_->find(command.getCode());
        if (!handler) {
            Logger::logDebug("[CommandDispatcher] No handler found for command: " + code);
            throw core::types::UnsupportedCommandException(lineNumber, code);
        }

        Logger::logDebug("[CommandDispatcher] Line " + std::to_string(lineNumber) + ": dispatching " +
                         command.toString());
        handler->apply(command, state, lineNumber);
        state.incrementExecutedCommands();
    }

    const HandlerRegistry &CommandDispatcher::getRegistry() const {
        return *registry_;
    }

} // namespace cnc::translator
