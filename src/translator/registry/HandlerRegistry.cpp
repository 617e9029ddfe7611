//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/registry/HandlerRegistry.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/logger/Logger.hpp"

// Handler includes
#include "cnc/translator/handlers/motion/MotionHandler.hpp"
#include "cnc/translator/handlers/motion/HomeHandler.hpp"
#include "cnc/translator/handlers/motion/PositionHandler.hpp"
#include "cnc/translator/handlers/modal/ModalHandler.hpp"
#include "cnc/translator/handlers/program/ProgramHandler.hpp"
#include "cnc/translator/handlers/program/DwellHandler.hpp"
#include "cnc/translator/handlers/spindle/SpindleHandler.hpp"
#include "cnc/translator/handlers/coolant/CoolantHandler.hpp"
#include "cnc/translator/handlers/tool/ToolHandler.hpp"
#include "cnc/translator/handlers/feed/FeedRateHandler.hpp"

#include <utility>

namespace cnc::translator {

    using core::types::RegistryException;

    void HandlerRegistry::registerHandler(const CommandCode &code, HandlerPtr handler) {
        if (!handler) {
            throw RegistryException("Null handler for " + code.toString());
        }
        if (!handlers_.emplace(code, std::move(handler)).second) {
            throw RegistryException("Handler already registered for " + code.toString());
        }
        Logger::logDebug("[HandlerRegistry] Registered handler for " + code.toString() +
                         ", total: " + std::to_string(handlers_.size()));
    }

    void HandlerRegistry::registerWordHandler(char letter, HandlerPtr handler) {
        if (!handler) {
            throw RegistryException("Null word handler for " + std::string(1, letter));
        }
        if (!wordHandlers_.emplace(letter, std::move(handler)).second) {
            throw RegistryException("Word handler already registered for " + std::string(1, letter));
        }
        Logger::logDebug("[HandlerRegistry] Registered word handler for " + std::string(1, letter));
    }

    HandlerRegistry::HandlerPtr HandlerRegistry::find(const CommandCode &code) const {
        auto it = handlers_.find(code);
        if (it != handlers_.end()) {
            return it->second;
        }

        auto word = wordHandlers_.find(code.letter);
        if (word != wordHandlers_.end()) {
            return word->second;
        }
        return nullptr;
    }

    bool HandlerRegistry::contains(const CommandCode &code) const {
        return find(code) != nullptr;
    }

    size_t HandlerRegistry::size() const {
        return handlers_.size() + wordHandlers_.size();
    }

    std::vector<CommandCode> HandlerRegistry::codes() const {
        std::vector<CommandCode> result;
        result.reserve(handlers_.size());
        for (const auto &[code, handler]: handlers_) {
            result.push_back(code);
        }
        return result;
    }

    std::vector<char> HandlerRegistry::wordLetters() const {
        std::vector<char> result;
        result.reserve(wordHandlers_.size());
        for (const auto &[letter, handler]: wordHandlers_) {
            result.push_back(letter);
        }
        return result;
    }

    HandlerRegistry HandlerRegistry::createDefault() {
        HandlerRegistry registry;

        auto motion = std::make_shared<handlers::MotionHandler>();
        registry.registerHandler({'G', 0}, motion);
        registry.registerHandler({'G', 1}, motion);
        registry.registerHandler({'G', 28}, std::make_shared<handlers::HomeHandler>());
        registry.registerHandler({'G', 92}, std::make_shared<handlers::PositionHandler>());
        registry.registerHandler({'G', 4}, std::make_shared<handlers::DwellHandler>());

        auto modal = std::make_shared<handlers::ModalHandler>();
        for (int code: {17, 18, 19, 20, 21, 40, 49, 54, 55, 56, 57, 58, 59, 80, 90, 91, 93, 94}) {
            registry.registerHandler({'G', static_cast<double>(code)}, modal);
        }

        auto program = std::make_shared<handlers::ProgramHandler>();
        for (int code: {0, 1, 2, 30}) {
            registry.registerHandler({'M', static_cast<double>(code)}, program);
        }

        auto spindle = std::make_shared<handlers::SpindleHandler>();
        registry.registerHandler({'M', 3}, spindle);
        registry.registerHandler({'M', 4}, spindle);
        registry.registerHandler({'M', 5}, spindle);
        registry.registerWordHandler('S', spindle);

        auto coolant = std::make_shared<handlers::CoolantHandler>();
        registry.registerHandler({'M', 7}, coolant);
        registry.registerHandler({'M', 8}, coolant);
        registry.registerHandler({'M', 9}, coolant);

        auto tool = std::make_shared<handlers::ToolHandler>();
        registry.registerHandler({'M', 6}, tool);
        registry.registerWordHandler('T', tool);

        registry.registerWordHandler('F', std::make_shared<handlers::FeedRateHandler>());

        Logger::logInfo("[HandlerRegistry] Default registry ready with " + std::to_string(registry.size()) +
                        " entries");
        return registry;
    }

} // namespace cnc::translator
