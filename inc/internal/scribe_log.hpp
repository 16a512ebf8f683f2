#ifndef SCRIBE_LOG_HPP
#define SCRIBE_LOG_HPP

#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace scribe {

// =============================================================================
// PHI-safe Logging (日志)
// =============================================================================
//
// 所有日志行格式: "[Tag] message"
//
// safeLog / safeWarn / safeError 始终输出, 只能用于运行状态、计数、时长等
// 非敏感信息。转写文本、摘要、token、音频数据只能经 debugLogPHI 输出,
// 且仅在 SCRIBE_DEBUG=true 时生效。
//

namespace log {

/// @brief 是否启用调试输出 (读取 SCRIBE_DEBUG 一次)
bool debugEnabled();

/// @brief 测试用: 覆盖调试开关
void setDebugEnabled(bool enabled);

/// @brief 输出一整行 (加锁, 多线程下不会交错)
void writeLine(std::ostream& os, const std::string& tag, const std::string& message);

template <typename... Args>
std::string format(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

}  // namespace log

template <typename... Args>
void safeLog(const std::string& tag, Args&&... args) {
    log::writeLine(std::cout, tag, log::format(std::forward<Args>(args)...));
}

template <typename... Args>
void safeWarn(const std::string& tag, Args&&... args) {
    log::writeLine(std::cerr, tag, log::format(std::forward<Args>(args)...));
}

template <typename... Args>
void safeError(const std::string& tag, Args&&... args) {
    log::writeLine(std::cerr, tag, log::format(std::forward<Args>(args)...));
}

template <typename... Args>
void debugLog(const std::string& tag, Args&&... args) {
    if (log::debugEnabled()) {
        log::writeLine(std::cout, tag, log::format(std::forward<Args>(args)...));
    }
}

/// @brief 输出转写/摘要内容, 仅调试模式, 超长截断
void debugLogPHI(const std::string& tag, const std::string& content, size_t max_length = 100);

}  // namespace scribe

#endif  // SCRIBE_LOG_HPP
