#pragma once

#include <atomic>
#include <array>
#include <optional>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <chrono>

namespace wavetone {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type;
    char tag[32];      // Category or Tag
    float value;       // Numeric value (for Type::Event)
    char message[64];  // Static message (for Type::Message)
    uint64_t timestamp; // Microseconds since steady_clock epoch
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer for RT-Safe logging.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(const T& item) {
        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);

        if (((h + 1) & mask) == t) {
            return false; // Full
        }

        buffer[h] = item;
        head.store((h + 1) & mask, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t t = tail.load(std::memory_order_relaxed);
        size_t h = head.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        T item = buffer[t];
        tail.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

private:
    std::array<T, Size> buffer;
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton Logger for Audio Thread telemetry.
 *
 * The audio thread is the only producer. The main thread drains entries
 * with flush() or pop_entry().
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_us();
        if (!ring_buffer.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void log_event(const char* tag, float value) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_us();
        if (!ring_buffer.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain all pending entries to the stream.
     *
     * High-rate events (one per audio block) are summarised per tag rather
     * than printed line by line. Tags beyond the first MAX_EVENT_TAGS seen in
     * one flush are counted on an "other" line.
     *
     * @return Number of entries drained.
     */
    size_t flush(std::ostream& out = std::cout) {
        struct EventSummary {
            char tag[32];
            size_t count;
            float max;
        };
        std::array<EventSummary, MAX_EVENT_TAGS> summaries{};
        size_t tags_used = 0;
        size_t other_events = 0;
        size_t drained = 0;

        while (auto entry = ring_buffer.pop()) {
            ++drained;
            if (entry->type == LogEntry::Type::Message) {
                out << "[" << entry->tag << "] " << entry->message << '\n';
                continue;
            }

            size_t slot = 0;
            while (slot < tags_used && std::strncmp(summaries[slot].tag, entry->tag, sizeof(entry->tag)) != 0) {
                ++slot;
            }
            if (slot == tags_used) {
                if (tags_used == MAX_EVENT_TAGS) {
                    ++other_events;
                    continue;
                }
                std::memcpy(summaries[slot].tag, entry->tag, sizeof(entry->tag));
                summaries[slot].max = entry->value;
                ++tags_used;
            }
            auto& summary = summaries[slot];
            if (entry->value > summary.max) summary.max = entry->value;
            ++summary.count;
        }

        for (size_t i = 0; i < tags_used; ++i) {
            out << "[" << summaries[i].tag << "] " << summaries[i].count
                << " events, max " << summaries[i].max << '\n';
        }
        if (other_events > 0) {
            out << "[AudioLogger] " << other_events << " events with other tags" << '\n';
        }

        const size_t dropped = dropped_.exchange(0, std::memory_order_relaxed);
        if (dropped > 0) {
            out << "[AudioLogger] dropped " << dropped << " entries (ring buffer full)" << '\n';
        }

        out.flush();
        return drained;
    }

    static constexpr size_t MAX_EVENT_TAGS = 8;

private:
    AudioLogger() = default;

    static uint64_t now_us() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
    std::atomic<size_t> dropped_{0};
};

} // namespace wavetone
