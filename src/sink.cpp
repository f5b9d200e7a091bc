#include "sink.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>

namespace dlbuild {

StreamSink::StreamSink(std::ostream& os, bool console) : os_(os), console_(console) {}

bool StreamSink::write(const char* data, std::size_t n){
    if(console_){
        std::lock_guard<std::mutex> lk(consoleMutex());
        os_.write(data, static_cast<std::streamsize>(n));
        os_.flush();
    } else {
        os_.write(data, static_cast<std::streamsize>(n));
    }
    return static_cast<bool>(os_);
}

bool FileSink::open(const fs::path& p, std::string& err){
    path_ = p;
    if(p.has_parent_path()) ensureDir(p.parent_path());
    out_.open(p, std::ios::binary | std::ios::trunc);
    if(!out_){
        err = p.string() + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool FileSink::write(const char* data, std::size_t n){
    if(!out_.is_open()) return false;
    out_.write(data, static_cast<std::streamsize>(n));
    return static_cast<bool>(out_);
}

bool FileSink::close(std::string& err){
    if(!out_.is_open()) return true;
    out_.close();
    if(out_.fail()){
        err = path_.string() + ": erro ao gravar";
        return false;
    }
    return true;
}

bool DigestSink::write(const char* data, std::size_t n){
    md5_.update(data, n);
    return true;
}

TeeSink::TeeSink(ByteSink& first, ByteSink& second) : sinks_{&first, &second} {}

bool TeeSink::write(const char* data, std::size_t n){
    for(int i=0;i<2;++i){
        if(failed_[i]) continue;
        if(!sinks_[i]->write(data, n)) failed_[i] = true;
    }
    return !failed_[0] && !failed_[1];
}

} // namespace dlbuild
