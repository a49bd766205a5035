/**
 * @file Errors.hpp
 * @brief Exception types raised by the version store.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sceneloom::domain {

/**
 * @class StorageError
 * @brief A durable write (or directory creation) failed.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class NotFoundError
 * @brief The requested project or version does not exist.
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class CorruptRecordError
 * @brief A metadata record exists but cannot be read or parsed.
 *
 * Derives from NotFoundError so callers that only care about "can't load it"
 * catch both, while callers that need to tell the two apart still can.
 */
class CorruptRecordError : public NotFoundError {
public:
    explicit CorruptRecordError(const std::string& what) : NotFoundError(what) {}
};

/**
 * @class ParentNotFoundError
 * @brief A version was created with a parent that does not resolve within its project.
 */
class ParentNotFoundError : public std::runtime_error {
public:
    explicit ParentNotFoundError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace sceneloom::domain
