#include "Digest.h"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace bacnet_scan {

std::string sha256_hex(const std::string& data){
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    if(!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), md, &mdlen) != 1
        || mdlen != 32){
        throw std::runtime_error("sha256 digest failed");
    }
    static const char* hx = "0123456789abcdef";
    std::string out; out.reserve(64);
    for(unsigned i = 0; i < mdlen; ++i){ out.push_back(hx[md[i] >> 4]); out.push_back(hx[md[i] & 0xF]); }
    return out;
}

}
