#ifndef SCRIBE_ENGINE_PLATFORM_RECOGNIZER_HPP
#define SCRIBE_ENGINE_PLATFORM_RECOGNIZER_HPP

#include <functional>
#include <string>

#include "../scribe_types.hpp"

namespace scribe {
namespace engine {

// =============================================================================
// Platform Recognizer (宿主平台提供的原生识别, "Browser STT")
// =============================================================================
//
// 由宿主实现。结果在任意线程回调, 最终结果经 LiveSession 去重后插入。
//

struct PlatformRecognizerHandlers {
    std::function<void(const std::string& text, bool is_final)> on_result;
    std::function<void(const ErrorInfo& error)> on_error;
    std::function<void()> on_end;
};

class IPlatformRecognizer {
public:
    virtual ~IPlatformRecognizer() = default;

    /// @brief 当前平台是否可用
    virtual bool isSupported() const = 0;

    /// @brief 开始识别, 失败时不回调 on_end
    virtual ErrorInfo start(PlatformRecognizerHandlers handlers) = 0;

    /// @brief 同步停止, 返回后不再回调
    virtual void stop() = 0;
};

}  // namespace engine
}  // namespace scribe

#endif  // SCRIBE_ENGINE_PLATFORM_RECOGNIZER_HPP
