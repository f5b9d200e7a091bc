// checksum.hpp: MD5 incremental (OpenSSL EVP)
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace dlbuild {

class Md5 {
public:
    Md5();
    ~Md5();
    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void update(const char* data, std::size_t n);
    // Digest em hex minúsculo (32 caracteres). O objeto volta ao estado inicial.
    std::string finish();

private:
    EVP_MD_CTX* ctx_;
};

std::string md5Hex(const std::string& bytes);

// nullopt se o arquivo não existir ou não puder ser lido
std::optional<std::string> md5File(const std::filesystem::path& p);

bool isMd5Hex(const std::string& s);
bool checksumMatches(const std::string& digest, const std::string& expected);

} // namespace dlbuild
