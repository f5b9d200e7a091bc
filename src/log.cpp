#include "log.hpp"

#include <atomic>
#include <iostream>

namespace dlbuild {

static std::atomic<bool> log_color{true};
static std::atomic<bool> log_verbose{false};

void setLogColor(bool on){ log_color = on; }
void setLogVerbose(bool on){ log_verbose = on; }

std::mutex& consoleMutex(){
    static std::mutex mtx;
    return mtx;
}

static void emit(const char* color, const char* tag, const std::string& s, bool bold_msg=false){
    std::lock_guard<std::mutex> lk(consoleMutex());
    if(log_color){
        std::cerr << color << ansi::bold << tag << ansi::reset;
        if(bold_msg) std::cerr << ansi::bold << s << ansi::reset << "\n";
        else std::cerr << s << "\n";
    } else {
        std::cerr << tag << s << "\n";
    }
}

void logInfo(const std::string& s){ emit(ansi::green, "[*] ", s); }
void logWarn(const std::string& s){ emit(ansi::yellow, "[!] ", s); }
void logErr(const std::string& s){ emit(ansi::red, "[x] ", s); }
void logFatal(const std::string& s){ emit(ansi::red, "[x] ", s, true); }

void logDebug(const std::string& s){
    if(!log_verbose) return;
    std::lock_guard<std::mutex> lk(consoleMutex());
    if(log_color) std::cerr << ansi::dim << "$ " << s << ansi::reset << "\n";
    else std::cerr << "$ " << s << "\n";
}

} // namespace dlbuild
