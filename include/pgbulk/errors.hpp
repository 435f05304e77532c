/**
 * @file errors.hpp
 * @brief Exception hierarchy for bulk loads
 */

#pragma once

#include <stdexcept>
#include <string>

namespace PgBulk {

/**
 * @brief Base of every error raised by the loader.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid job definition. Raised before any transaction work.
 */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error("Configuration error: " + message) {}
};

/**
 * @brief Restored indexes or constraints differ from the captured snapshot.
 */
class IntegrityError : public Error {
public:
    explicit IntegrityError(const std::string& message)
        : Error("Integrity error: " + message) {}
};

/**
 * @brief File read, CSV parse, parse hook or copy-sink failure.
 */
class IoError : public Error {
public:
    explicit IoError(const std::string& message)
        : Error("I/O error: " + message) {}
};

/**
 * @brief Failed libpq call. Carries the server message.
 */
class DatabaseError : public Error {
public:
    explicit DatabaseError(const std::string& message)
        : Error("PostgreSQL " + message) {}
};

} // namespace PgBulk
