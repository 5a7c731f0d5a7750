#include "checksum.h"
#include "file_io.h"
#include "services/logger/LogManager.h"

#include <memory>
#include <openssl/evp.h>

namespace lmenu::checksum {

std::string sha256Hex(std::string_view bytes) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        logging::LogManager::error("SHA-256 digest failed");
        return {};
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0f]);
    }
    return out;
}

std::optional<std::string> fileChecksum(const std::string& path) {
    auto bytes = fileio::readFile(path);
    if (!bytes) {
        return std::nullopt;
    }
    return sha256Hex(*bytes);
}
}
