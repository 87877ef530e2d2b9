/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by the parser, the store and the scanner.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace FontGrep {

/**
 * @brief Base class of every error raised by fontgrep.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A file could not be opened, read or stat'ed.
 *
 * Raised per file; the scanner logs it and skips the file.
 */
class IoError : public Error {
public:
    IoError(const std::filesystem::path& path, const std::string& what)
        : Error(path.string() + ": " + what), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/**
 * @brief Font bytes could not be turned into metadata.
 */
class FontParseError : public Error {
public:
    enum class Kind {
        NotAFont,   ///< No recognised font signature
        Corrupt     ///< Recognised signature, but truncated or malformed data
    };

    FontParseError(Kind kind, const std::string& what)
        : Error(what), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

/**
 * @brief The metadata cache could not be opened, written or queried.
 */
class StoreError : public Error {
public:
    StoreError(const std::string& what, int sqliteCode = 0)
        : Error(what), m_code(sqliteCode) {}

    /// SQLite result code of the failing call (0 when not applicable)
    int code() const { return m_code; }

private:
    int m_code;
};

/**
 * @brief A search criterion could not be parsed.
 *
 * Raised before any scan or query starts.
 */
class InvalidCriteriaError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Invalid run configuration (missing cache target, bad job count).
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace FontGrep
