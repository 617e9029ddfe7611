//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/handlers/ICommandHandler.hpp"
#include "cnc/translator/model/CommandCode.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace cnc::translator {

    /**
     * @brief Tabella codice -> handler.
     *
     * Filled once at start-up, then shared read-only (the dispatcher keeps a
     * pointer to const). Registering the same code twice is an error.
     */
    class HandlerRegistry {
    public:
        using HandlerPtr = std::shared_ptr<const handlers::ICommandHandler>;

        void registerHandler(const CommandCode &code, HandlerPtr handler);

        // Handler for every value of a letter: the stand-alone words S1000, F300, T2
        void registerWordHandler(char letter, HandlerPtr handler);

        // Exact code first, then the word handler of its letter; nullptr when absent
        HandlerPtr find(const CommandCode &code) const;

        bool contains(const CommandCode &code) const;

        size_t size() const;

        std::vector<CommandCode> codes() const;

        std::vector<char> wordLetters() const;

        static HandlerRegistry createDefault();

    private:
        std::map<CommandCode, HandlerPtr> handlers_;
        std::map<char, HandlerPtr> wordHandlers_;
    };

} // namespace cnc::translator
