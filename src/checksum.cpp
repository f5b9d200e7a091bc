#include "checksum.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace dlbuild {

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_) throw std::runtime_error("EVP_MD_CTX_new falhou");
    if(EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1){
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex(md5) falhou");
    }
}

Md5::~Md5(){ EVP_MD_CTX_free(ctx_); }

void Md5::update(const char* data, std::size_t n){
    if(n==0) return;
    if(EVP_DigestUpdate(ctx_, data, n) != 1)
        throw std::runtime_error("EVP_DigestUpdate falhou");
}

std::string Md5::finish(){
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(ctx_, md, &len) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex falhou");
    static const char hex[] = "0123456789abcdef";
    std::string r; r.reserve(len*2);
    for(unsigned int i=0;i<len;++i){
        r.push_back(hex[md[i] >> 4]);
        r.push_back(hex[md[i] & 0x0f]);
    }
    if(EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex(md5) falhou");
    return r;
}

std::string md5Hex(const std::string& bytes){
    Md5 h; h.update(bytes.data(), bytes.size());
    return h.finish();
}

std::optional<std::string> md5File(const std::filesystem::path& p){
    std::ifstream in(p, std::ios::binary);
    if(!in) return std::nullopt;
    Md5 h;
    char buf[4096];
    while(in.read(buf, sizeof(buf)) || in.gcount() > 0){
        h.update(buf, static_cast<std::size_t>(in.gcount()));
    }
    if(in.bad()) return std::nullopt;
    return h.finish();
}

bool isMd5Hex(const std::string& s){
    if(s.size()!=32) return false;
    for(char c: s) if(!std::isxdigit((unsigned char)c)) return false;
    return true;
}

bool checksumMatches(const std::string& digest, const std::string& expected){
    if(digest.size()!=expected.size()) return false;
    for(size_t i=0;i<digest.size();++i){
        if(std::tolower((unsigned char)digest[i]) != std::tolower((unsigned char)expected[i])) return false;
    }
    return true;
}

} // namespace dlbuild
