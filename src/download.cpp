#include "download.hpp"
#include "checksum.hpp"
#include "log.hpp"
#include "util.hpp"

#include <curl/curl.h>

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

namespace dlbuild {

// ========================= libcurl =========================
size_t curlWriteToSink(char* ptr, size_t size, size_t nmemb, void* userdata){
    ByteSink* out = static_cast<ByteSink*>(userdata);
    size_t total = size * nmemb;
    // exceções não podem atravessar o libcurl; 0 aborta com CURLE_WRITE_ERROR
    try{
        if(!out->write(ptr, total)) return 0;
    }catch(const std::exception& ex){
        logErr(std::string("Falha ao gravar dados recebidos: ") + ex.what());
        return 0;
    }
    return total;
}

CurlTransport::CurlTransport(){
    if(curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        throw std::runtime_error("curl_global_init falhou");
}

CurlTransport::~CurlTransport(){ curl_global_cleanup(); }

bool CurlTransport::get(const std::string& url, ByteSink& out, std::string& err){
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if(!curl){
        err = "curl_easy_init falhou";
        return false;
    }
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curlWriteToSink);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&out));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    // só http(s), também nos redirecionamentos
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "dlbuild/1.0");

    logDebug("GET " + url);
    CURLcode res = curl_easy_perform(curl.get());
    if(res != CURLE_OK){
        err = url + ": " + (errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res)));
        return false;
    }
    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if(code >= 400){
        err = url + ": servidor respondeu " + std::to_string(code);
        return false;
    }
    return true;
}

// ========================= Cache de fontes =========================
bool isSupportedUrl(const std::string& url){
    return isUrl(url) && !cacheFilename(url).empty();
}

std::string cacheFilename(const std::string& url){
    return baseName(url);
}

SourceFetcher::SourceFetcher(Transport& transport, fs::path directory)
    : transport_(transport), directory_(std::move(directory)) {}

fs::path SourceFetcher::localPath(const std::string& url) const {
    return directory_ / cacheFilename(url);
}

bool SourceFetcher::fetch(const std::string& url, std::string& digest, std::string& err){
    fs::path dest = localPath(url);
    FileSink file;
    if(!file.open(dest, err)) return false;
    DigestSink md5;
    TeeSink tee(file, md5);

    logInfo("Baixando " + url);
    bool ok = transport_.get(url, tee, err);
    std::string close_err;
    bool closed = file.close(close_err);
    if(ok && (!closed || tee.firstFailed())){
        ok = false;
        err = closed ? dest.string() + ": erro ao gravar" : close_err;
    }
    if(!ok){
        std::error_code ec; fs::remove(dest, ec);
        return false;
    }
    digest = md5.finish();
    return true;
}

SourceFetcher::Status SourceFetcher::ensureSource(const std::string& url, const std::string& expected,
                                                  std::string& digest, std::string& err){
    if(!supports(url)){
        err = url;
        return Status::Unsupported;
    }
    auto sum = md5File(localPath(url));
    if(sum && checksumMatches(*sum, expected)){
        logInfo("Usando cache existente: " + localPath(url).string());
        digest = *sum;
        return Status::Cached;
    }
    if(!fetch(url, digest, err)) return Status::Failed;
    return Status::Fetched;
}

} // namespace dlbuild
