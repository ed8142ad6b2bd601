#include "core/secure_wipe.hpp"

#include <openssl/crypto.h>

namespace logshield {

void secure_wipe(std::string& buffer) noexcept {
    if (buffer.capacity() == 0) return;
    // Grow size to capacity first: only [0, size()) may be written through data()
    buffer.resize(buffer.capacity());
    OPENSSL_cleanse(buffer.data(), buffer.size());
    buffer.clear();
}

} // namespace logshield
