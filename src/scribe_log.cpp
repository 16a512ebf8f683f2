#include "scribe_log.hpp"

#include <atomic>
#include <cstdlib>
#include <mutex>

namespace scribe {
namespace log {

namespace {

std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

int readDebugFlag() {
    const char* env = std::getenv("SCRIBE_DEBUG");
    if (env && std::string(env) == "true") {
        return 1;
    }
    return 0;
}

// -1: 未初始化
std::atomic<int> g_debug{-1};

}  // namespace

bool debugEnabled() {
    int value = g_debug.load();
    if (value < 0) {
        value = readDebugFlag();
        g_debug.store(value);
    }
    return value == 1;
}

void setDebugEnabled(bool enabled) {
    g_debug.store(enabled ? 1 : 0);
}

void writeLine(std::ostream& os, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(outputMutex());
    os << "[" << tag << "] " << message << std::endl;
}

}  // namespace log

void debugLogPHI(const std::string& tag, const std::string& content, size_t max_length) {
    if (!log::debugEnabled() || content.empty()) {
        return;
    }
    if (content.size() > max_length) {
        log::writeLine(std::cout, tag, content.substr(0, max_length) + "...");
    } else {
        log::writeLine(std::cout, tag, content);
    }
}

}  // namespace scribe
