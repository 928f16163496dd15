#include "fieldsync/entity.hpp"
#include <sodium.h>
#include <stdexcept>

namespace fieldsync {

std::string generate_client_id() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium init failed");
    }

    unsigned char bytes[16];
    randombytes_buf(bytes, sizeof(bytes));

    char hex[sizeof(bytes) * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), bytes, sizeof(bytes));
    return std::string("local-") + hex;
}

} // namespace fieldsync
