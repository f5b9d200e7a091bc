// sink.hpp: destinos de bytes (console, arquivo, digest e fan-out)
#pragma once

#include "checksum.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>

namespace dlbuild {

namespace fs = std::filesystem;

class ByteSink {
public:
    virtual ~ByteSink() = default;
    // false quando os bytes não puderam ser gravados
    virtual bool write(const char* data, std::size_t n) = 0;
};

// Escreve num ostream. Com console=true usa o mesmo mutex das mensagens de log.
class StreamSink : public ByteSink {
public:
    explicit StreamSink(std::ostream& os, bool console=false);
    bool write(const char* data, std::size_t n) override;
private:
    std::ostream& os_;
    bool console_;
};

class FileSink : public ByteSink {
public:
    // Cria ou trunca o arquivo (e o diretório pai).
    bool open(const fs::path& p, std::string& err);
    bool write(const char* data, std::size_t n) override;
    bool close(std::string& err);
    const fs::path& path() const { return path_; }
private:
    std::ofstream out_;
    fs::path path_;
};

class DigestSink : public ByteSink {
public:
    bool write(const char* data, std::size_t n) override;
    std::string finish() { return md5_.finish(); }
private:
    Md5 md5_;
};

// Fan-out para dois destinos. Cada bloco é oferecido aos dois, na ordem.
// Um destino que falha é marcado e não recebe mais blocos; o outro continua
// recebendo o fluxo completo. write() retorna false a partir da primeira falha.
class TeeSink : public ByteSink {
public:
    TeeSink(ByteSink& first, ByteSink& second);
    bool write(const char* data, std::size_t n) override;
    bool firstFailed() const { return failed_[0]; }
    bool secondFailed() const { return failed_[1]; }
private:
    ByteSink* sinks_[2];
    bool failed_[2] = {false, false};
};

} // namespace dlbuild
