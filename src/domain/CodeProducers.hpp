/**
 * @file CodeProducers.hpp
 * @brief Interfaces for the collaborators that produce new scene code.
 */

#pragma once
#include <optional>
#include <string>

namespace sceneloom::domain {

/**
 * @class CodeGenerator
 * @brief Turns a prompt (and optionally the current code) into new scene code.
 *
 * Implemented outside this repository by the AI provider clients.
 */
class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;

    /**
     * @param prompt User request.
     * @param currentCode Code currently in the editor, when the user asked to include it.
     * @return Generated code, or nullopt if the provider produced nothing usable.
     */
    virtual std::optional<std::string> generate(const std::string& prompt,
                                                const std::optional<std::string>& currentCode) = 0;
};

/**
 * @class CodeTransform
 * @brief Rewrites scene code, e.g. after a variable was changed in the variable explorer.
 */
class CodeTransform {
public:
    virtual ~CodeTransform() = default;

    virtual std::string apply(const std::string& code) = 0;
};

} // namespace sceneloom::domain
