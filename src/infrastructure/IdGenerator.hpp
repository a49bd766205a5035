#pragma once
#include <string>

namespace sceneloom::infrastructure {

/**
 * @brief Generates random (version 4) UUID strings, e.g. "550e8400-e29b-41d4-a716-446655440000".
 *
 * Thread-safe. Uniqueness against existing records is checked by the caller.
 */
std::string GenerateUuid();

} // namespace sceneloom::infrastructure
