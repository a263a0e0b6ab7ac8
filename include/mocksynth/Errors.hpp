/**
 * @file Errors.hpp
 * @brief Exception types for mocksynth
 *
 * Error taxonomy:
 * - MocksynthError: Base class
 * - FileNotFoundError: Input file not found
 * - DocumentParseError: JSON/TOML syntax errors, unsupported formats
 * - SchemaError: Schema document does not describe a block
 * - DecodeError: Document value does not fit the type it is decoded against
 * - ConversionError: Value cannot be converted to a wanted type
 * - MissingMandatoryConfig: Mandatory settings absent
 *
 * Recoverable problems found while synthesizing a value are reported as
 * Diagnostics, never thrown.
 */

#ifndef MOCKSYNTH_ERRORS_HPP
#define MOCKSYNTH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace mocksynth {

/**
 * @brief Base class for all mocksynth exceptions
 */
class MocksynthError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public MocksynthError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : MocksynthError("File not found: " + path)
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
 * @brief Document parse error (JSON/TOML syntax, unknown extension)
 */
class DocumentParseError : public MocksynthError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, std::string details)
        : MocksynthError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Schema document is malformed
 *
 * Raised only by the schema loader. The synthesizer itself assumes a
 * well-formed schema.
 */
class SchemaError : public MocksynthError {
public:
    /**
     * @brief Construct with the location inside the schema and a reason
     * @param where Dot-path of the offending schema element ("" for root)
     * @param reason What is wrong with it
     */
    SchemaError(std::string where, std::string reason)
        : MocksynthError("Invalid schema" +
                         (where.empty() ? std::string() : " at '" + where + "'") +
                         ": " + reason)
        , where_(std::move(where))
        , reason_(std::move(reason))
    {}

    const std::string& where() const noexcept {
        return where_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string where_;
    std::string reason_;
};

/**
 * @brief A document value does not fit the type it is decoded against
 */
class DecodeError : public MocksynthError {
public:
    /**
     * @brief Construct with path, expected type, and actual JSON kind
     * @param path Path of the offending value (e.g., "block[0].id")
     * @param expected Friendly name of the wanted type
     * @param actual Kind of the JSON value encountered
     */
    DecodeError(std::string path, std::string expected, std::string actual)
        : MocksynthError("Cannot decode " + actual + " as " + expected +
                         (path.empty() ? std::string() : " at '" + path + "'"))
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A value cannot be converted to the wanted type
 *
 * what() is the bare conversion message (e.g., "string required") so
 * callers can embed it in a longer diagnostic.
 */
class ConversionError : public MocksynthError {
public:
    /**
     * @brief Construct with wanted type name and message
     * @param want Friendly name of the wanted type
     * @param message Reason, possibly prefixed with the failing element
     */
    ConversionError(std::string want, const std::string& message)
        : MocksynthError(message)
        , want_(std::move(want))
    {}

    const std::string& want() const noexcept {
        return want_;
    }

private:
    std::string want_;
};

/**
 * @brief Mandatory settings keys are missing after merge
 */
class MissingMandatoryConfig : public MocksynthError {
public:
    /**
     * @brief Construct with list of missing keys
     * @param keys Dot-paths of missing mandatory keys
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : MocksynthError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace mocksynth

#endif // MOCKSYNTH_ERRORS_HPP
