#include "audit/Sha256.hpp"
#include "ledger/Errors.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

using namespace yieldguard;

std::string yieldguard::sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw StorageWriteError("[AUDIT] EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw StorageWriteError("[AUDIT] SHA-256 digest failed");
    }

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(digest[i]);
    return out.str();
}
