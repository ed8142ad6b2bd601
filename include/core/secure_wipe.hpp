#pragma once

#include <string>

namespace logshield {

/**
 * @brief Overwrite the characters of a buffer that held plaintext, then clear it.
 *
 * Uses OPENSSL_cleanse so the store is not elided by the optimizer. The
 * string is first grown to its capacity, which never reallocates, so
 * earlier contents lingering past the current end are wiped too.
 */
void secure_wipe(std::string& buffer) noexcept;

} // namespace logshield
