#ifndef SCRIBE_AUDIO_RING_BUFFER_HPP
#define SCRIBE_AUDIO_RING_BUFFER_HPP

#include <atomic>
#include <cstddef>
#include <vector>

namespace scribe {
namespace audio {

// =============================================================================
// SPSC Ring Buffer (单生产者单消费者无锁环形缓冲)
// =============================================================================
//
// 生产者: 音频回调线程 (不可阻塞)
// 消费者: 定时 flush 线程
//

template <typename T>
class SpscRingBuffer {
public:
    explicit SpscRingBuffer(size_t capacity)
        : buffer_(capacity), capacity_(capacity), head_(0), tail_(0) {}

    SpscRingBuffer(const SpscRingBuffer&) = delete;
    SpscRingBuffer& operator=(const SpscRingBuffer&) = delete;

    size_t capacity() const { return capacity_; }

    /// @brief 写入最多 n 个样本, 返回实际写入数 (满时丢弃剩余)
    size_t push(const T* data, size_t n) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t tail = tail_.load(std::memory_order_acquire);
        size_t free_space = capacity_ - (head - tail);
        size_t to_write = n < free_space ? n : free_space;
        for (size_t i = 0; i < to_write; ++i) {
            buffer_[(head + i) % capacity_] = data[i];
        }
        head_.store(head + to_write, std::memory_order_release);
        return to_write;
    }

    /// @brief 读取最多 n 个样本, 返回实际读取数
    size_t pop(T* out, size_t n) {
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t head = head_.load(std::memory_order_acquire);
        size_t available = head - tail;
        size_t to_read = n < available ? n : available;
        for (size_t i = 0; i < to_read; ++i) {
            out[i] = buffer_[(tail + i) % capacity_];
        }
        tail_.store(tail + to_read, std::memory_order_release);
        return to_read;
    }

    /// @brief 读取全部可用样本并追加到 out
    size_t drainInto(std::vector<T>& out) {
        size_t available = size();
        if (available == 0) return 0;
        size_t offset = out.size();
        out.resize(offset + available);
        size_t read = pop(out.data() + offset, available);
        out.resize(offset + read);
        return read;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return head - tail;
    }

    bool empty() const { return size() == 0; }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
};

}  // namespace audio
}  // namespace scribe

#endif  // SCRIBE_AUDIO_RING_BUFFER_HPP
