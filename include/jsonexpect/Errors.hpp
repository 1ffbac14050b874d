/**
 * @file Errors.hpp
 * @brief Exception types for jsonexpect input and configuration errors
 *
 * Validation mismatches are never exceptions: they are returned as
 * ValidationFailure records (see Result.hpp). The types below cover the
 * outer surfaces only:
 * - JsonExpectError: Base class
 * - FileNotFoundError: Document or rules file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - RuleError: Malformed option rule
 */

#ifndef JSONEXPECT_ERRORS_HPP
#define JSONEXPECT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace jsonexpect {

/**
 * @brief Base class for all jsonexpect exceptions
 */
class JsonExpectError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public JsonExpectError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : JsonExpectError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 */
class DocumentParseError : public JsonExpectError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line 1-based line of the error, 0 if unknown
     * @param column 1-based column of the error, 0 if unknown
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : JsonExpectError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Malformed option rule
 *
 * Raised while reading rules from a JSON/TOML document. Carries the
 * position of the offending rule in the rule list.
 */
class RuleError : public JsonExpectError {
public:
    /**
     * @brief Construct with rule index and reason
     * @param index 0-based position of the rule, or -1 for document-level errors
     * @param reason What is wrong with the rule
     */
    RuleError(int index, std::string reason)
        : JsonExpectError(index < 0
              ? "Invalid rules: " + reason
              : "Invalid rule #" + std::to_string(index) + ": " + reason)
        , index_(index)
        , reason_(std::move(reason))
    {}

    int index() const noexcept {
        return index_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    int index_;
    std::string reason_;
};

} // namespace jsonexpect

#endif // JSONEXPECT_ERRORS_HPP
