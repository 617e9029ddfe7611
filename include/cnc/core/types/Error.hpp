//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cnc::core::types {

    enum class ErrorKind {
        File,
        Parse,
        UnsupportedCommand,
        InvalidParameter,
        Registry,
        Config
    };

    inline std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::File:
                return "FileError";
            case ErrorKind::Parse:
                return "ParseError";
            case ErrorKind::UnsupportedCommand:
                return "UnsupportedCommand";
            case ErrorKind::InvalidParameter:
                return "InvalidParameter";
            case ErrorKind::Registry:
                return "RegistryError";
            case ErrorKind::Config:
                return "ConfigError";
        }
        return "Unknown";
    }

    /**
     * @brief Base of every error raised while interpreting a program.
     *
     * The message is complete on its own: when a line is involved it already
     * starts with "[Line N]".
     */
    class InterpreterException : public std::runtime_error {
    public:
        InterpreterException(ErrorKind kind, const std::string &msg, size_t lineNumber = 0)
            : std::runtime_error(msg), kind_(kind), lineNumber_(lineNumber) {}

        ErrorKind kind() const { return kind_; }

        size_t lineNumber() const { return lineNumber_; }

    protected:
        static std::string linePrefix(size_t lineNumber) {
            return "[Line " + std::to_string(lineNumber) + "] ";
        }

    private:
        ErrorKind kind_;
        size_t lineNumber_;
    };

    class FileException : public InterpreterException {
    public:
        FileException(const std::string &path, const std::string &reason)
            : InterpreterException(ErrorKind::File, "Cannot read file '" + path + "': " + reason),
              path_(path) {}

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };

    class ParseException : public InterpreterException {
    public:
        ParseException(size_t lineNumber, const std::string &token, const std::string &reason)
            : InterpreterException(ErrorKind::Parse,
                                   linePrefix(lineNumber) + "Parse error at token '" + token + "': " + reason,
                                   lineNumber),
              token_(token), reason_(reason) {}

        const std::string &token() const { return token_; }

        const std::string &reason() const { return reason_; }

    private:
        std::string token_;
        std::string reason_;
    };

    class UnsupportedCommandException : public InterpreterException {
    public:
        UnsupportedCommandException(size_t lineNumber, const std::string &code)
            : InterpreterException(ErrorKind::UnsupportedCommand,
                                   linePrefix(lineNumber) + "Unsupported command " + code,
                                   lineNumber),
              code_(code) {}

        const std::string &code() const { return code_; }

    private:
        std::string code_;
    };

    class InvalidParameterException : public InterpreterException {
    public:
        InvalidParameterException(size_t lineNumber, const std::string &code, char letter, const std::string &reason)
            : InterpreterException(ErrorKind::InvalidParameter,
                                   linePrefix(lineNumber) + "Invalid parameter '" + std::string(1, letter) +
                                   "' for " + code + ": " + reason,
                                   lineNumber),
              code_(code), letter_(letter) {}

        // No single letter is at fault (e.g. a required group of axis words is empty)
        InvalidParameterException(size_t lineNumber, const std::string &code, const std::string &reason)
            : InterpreterException(ErrorKind::InvalidParameter,
                                   linePrefix(lineNumber) + "Invalid parameters for " + code + ": " + reason,
                                   lineNumber),
              code_(code), letter_('\0') {}

        const std::string &code() const { return code_; }

        char letter() const { return letter_; }

    private:
        std::string code_;
        char letter_;
    };

    class RegistryException : public InterpreterException {
    public:
        explicit RegistryException(const std::string &msg)
            : InterpreterException(ErrorKind::Registry, msg) {}
    };

    class ConfigException : public InterpreterException {
    public:
        explicit ConfigException(const std::string &msg)
            : InterpreterException(ErrorKind::Config, msg) {}
    };

} // namespace cnc::core::types
