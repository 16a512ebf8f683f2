#ifndef SCRIBE_CLIENT_TRANSCRIPT_RECONCILER_HPP
#define SCRIBE_CLIENT_TRANSCRIPT_RECONCILER_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace scribe {
namespace client {

// =============================================================================
// Transcript Reconciler (最终结果去重与累积)
// =============================================================================
//
// 每个最终片段:
//   1. result_id 已提交过 -> 跳过
//   2. 去掉首尾空白, 与尾部窗口 (默认 80 字符) 做大小写不敏感的最长重叠匹配
//   3. 去掉重叠前缀后再去左侧空白, 以 "<text> " 形式插入
//
// 尾部窗口只用于去重, 权威文本是 transcript()。
//
// 使用示例:
//   TranscriptReconciler r;
//   r.commit("a", "the patient reports");      // "the patient reports "
//   r.commit("b", "Reports chest pain");        // "chest pain "
//

class TranscriptReconciler {
public:
    explicit TranscriptReconciler(size_t window = 80);

    /// @brief 计算待插入文本, 不修改状态 (id 已见过或去重后为空时返回 nullopt)
    /// @note 会记录 result_id, 同一 id 第二次调用返回 nullopt
    std::optional<std::string> prepare(const std::string& result_id, const std::string& text);

    /// @brief 文本已成功插入目标后调用, 更新累积文本与尾部窗口
    void accept(const std::string& inserted);

    /// @brief prepare + accept, 返回实际插入的文本 (可能为空)
    std::string commit(const std::string& result_id, const std::string& text);

    /// @brief 新会话: 清除已见 id, 保留文本与尾部窗口 (用于 resume)
    void beginSession();

    /// @brief 全部清空
    void reset();

    std::string transcript() const;
    std::string tail() const;
    size_t window() const { return window_; }

    /// @brief tail 的后缀与 text 的前缀 (大小写不敏感) 的最长重叠长度
    static size_t overlapLength(const std::string& tail, const std::string& text);

private:
    const size_t window_;
    mutable std::mutex mutex_;
    std::set<std::string> seen_ids_;
    std::string transcript_;
    std::string tail_;
};

}  // namespace client
}  // namespace scribe

#endif  // SCRIBE_CLIENT_TRANSCRIPT_RECONCILER_HPP
