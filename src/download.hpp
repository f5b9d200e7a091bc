// download.hpp: transporte HTTP e cache de fontes verificado por MD5
#pragma once

#include "sink.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace dlbuild {

namespace fs = std::filesystem;

class Transport {
public:
    virtual ~Transport() = default;
    // GET url; o corpo vai para out. false + err em falha de transporte
    // (conexão, status HTTP >= 400, ou out recusou os bytes).
    virtual bool get(const std::string& url, ByteSink& out, std::string& err) = 0;
};

// libcurl, um handle por requisição. Faz curl_global_init/cleanup.
class CurlTransport : public Transport {
public:
    CurlTransport();
    ~CurlTransport() override;
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    bool get(const std::string& url, ByteSink& out, std::string& err) override;
};

// CURLOPT_WRITEFUNCTION: repassa o bloco ao ByteSink em userdata.
// Retorna 0 (aborta a transferência) se o sink recusar ou lançar.
size_t curlWriteToSink(char* ptr, size_t size, size_t nmemb, void* userdata);

bool isSupportedUrl(const std::string& url);
std::string cacheFilename(const std::string& url);

class SourceFetcher {
public:
    enum class Status { Cached, Fetched, Unsupported, Failed };

    SourceFetcher(Transport& transport, fs::path directory);

    bool supports(const std::string& url) const { return isSupportedUrl(url); }
    fs::path localPath(const std::string& url) const;

    // Baixa url para localPath(url), calculando o MD5 durante a escrita.
    // Em falha o arquivo parcial é removido.
    bool fetch(const std::string& url, std::string& digest, std::string& err);

    // Cache válido: Cached com o digest local. Senão baixa: Fetched com o
    // digest calculado, que não é comparado aqui.
    Status ensureSource(const std::string& url, const std::string& expected,
                        std::string& digest, std::string& err);

private:
    Transport& transport_;
    fs::path directory_;
};

} // namespace dlbuild
