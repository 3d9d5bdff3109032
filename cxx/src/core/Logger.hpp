#pragma once

#include <atomic>
#include <string_view>
#include <array>
#include <optional>
#include <ostream>
#include <chrono>
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>

namespace fretboard {

/**
 * @brief Represents a single log record.
 * Fixed-size so the audio thread can log without allocating.
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    Type type = Type::Message;
    Level level = Level::Info;
    char tag[32] = {};
    float value = 0.0f;       // For Type::Event
    char message[96] = {};    // For Type::Message
    uint64_t timestamp_us = 0;
};

/**
 * @brief Bounded lock-free ring: many producers, one consumer.
 *
 * Each slot carries a sequence number. A producer claims the slot at head_
 * with a CAS, writes it, then publishes it by bumping the slot sequence; the
 * consumer only reads slots whose sequence says they are published. Producers
 * never wait on each other or on the consumer; a full ring rejects the push.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    LockFreeRingBuffer() {
        for (size_t i = 0; i < Size; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    bool push(const T& item) {
        size_t pos = head_.load(std::memory_order_relaxed);
        for (;;) {
            Slot& slot = slots_[pos & mask];
            const size_t seq = slot.sequence.load(std::memory_order_acquire);
            const auto lag = static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);
            if (lag == 0) {
                if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    slot.item = item;
                    slot.sequence.store(pos + 1, std::memory_order_release);
                    return true;
                }
            } else if (lag < 0) {
                return false; // Full
            } else {
                pos = head_.load(std::memory_order_relaxed);
            }
        }
    }

    std::optional<T> pop() {
        const size_t pos = tail_.load(std::memory_order_relaxed);
        Slot& slot = slots_[pos & mask];
        if (slot.sequence.load(std::memory_order_acquire) != pos + 1) {
            return std::nullopt; // Empty, or the producer has not published yet
        }
        T item = slot.item;
        slot.sequence.store(pos + Size, std::memory_order_release);
        tail_.store(pos + 1, std::memory_order_relaxed);
        return item;
    }

private:
    struct Slot {
        std::atomic<size_t> sequence{0};
        T item{};
    };

    static constexpr size_t mask = Size - 1;
    std::array<Slot, Size> slots_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

/**
 * @brief Process-wide logger shared by the quiz loop and the audio thread.
 *
 * Producers never block: when the ring is full the entry is dropped and
 * counted. Events pass the level filter as Debug, so per-period driver
 * metrics stay out of an Info-level console. A consumer (the CLI main loop, the C API poller or a test)
 * drains entries with pop_entry() or flush().
 */
class Logger {
public:
    static constexpr size_t CAPACITY = 1024;

    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void log(LogEntry::Level level, std::string_view tag, std::string_view msg) {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        entry.level = level;
        copy_text(entry.tag, sizeof(entry.tag), tag);
        copy_text(entry.message, sizeof(entry.message), msg);
        entry.timestamp_us = now_us();
        push(entry);
    }

    void log_message(std::string_view tag, std::string_view msg) {
        log(LogEntry::Level::Info, tag, msg);
    }

    void log_event(std::string_view tag, float value) {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        copy_text(entry.tag, sizeof(entry.tag), tag);
        entry.value = value;
        entry.timestamp_us = now_us();
        push(entry);
    }

    std::optional<LogEntry> pop_entry() {
        return ring_buffer_.pop();
    }

    void set_log_to_console(bool enabled) { log_to_console_.store(enabled); }
    bool log_to_console() const { return log_to_console_.load(); }

    void set_min_level(LogEntry::Level level) { min_level_.store(level); }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    /**
     * @brief Drain every pending entry, printing it when console logging is on.
     */
    void flush(std::ostream& out) {
        const bool print = log_to_console_.load();
        while (auto entry = ring_buffer_.pop()) {
            if (print) {
                format(out, *entry);
            }
        }
    }

    static const char* level_name(LogEntry::Level level) {
        switch (level) {
            case LogEntry::Level::Debug: return "DEBUG";
            case LogEntry::Level::Info: return "INFO";
            case LogEntry::Level::Warning: return "WARN";
            case LogEntry::Level::Error: return "ERROR";
        }
        return "INFO";
    }

    static void format(std::ostream& out, const LogEntry& entry) {
        const uint64_t ms = entry.timestamp_us / 1000;
        out << "[" << ms / 1000 << "." << (ms % 1000) / 100 << (ms % 100) / 10 << ms % 10 << "] ";
        if (entry.type == LogEntry::Type::Event) {
            out << "EVENT " << entry.tag << "=" << entry.value << "\n";
        } else {
            out << level_name(entry.level) << " " << entry.tag << ": " << entry.message << "\n";
        }
    }

private:
    Logger() : start_(std::chrono::steady_clock::now()) {}

    void push(const LogEntry& entry) {
        const auto level = entry.type == LogEntry::Type::Event ? LogEntry::Level::Debug : entry.level;
        if (level < min_level_.load()) {
            return;
        }
        if (!ring_buffer_.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    static void copy_text(char* dest, size_t capacity, std::string_view src) {
        const size_t n = std::min(src.size(), capacity - 1);
        std::memcpy(dest, src.data(), n);
        dest[n] = '\0';
    }

    uint64_t now_us() const {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_).count());
    }

    const std::chrono::steady_clock::time_point start_;
    LockFreeRingBuffer<LogEntry, CAPACITY> ring_buffer_;
    std::atomic<bool> log_to_console_{false};
    std::atomic<LogEntry::Level> min_level_{LogEntry::Level::Debug};
    std::atomic<size_t> dropped_{0};
};

} // namespace fretboard

#define LOG_DEBUG(tag, msg) ::fretboard::Logger::instance().log(::fretboard::LogEntry::Level::Debug, (tag), (msg))
#define LOG_INFO(tag, msg) ::fretboard::Logger::instance().log(::fretboard::LogEntry::Level::Info, (tag), (msg))
#define LOG_WARN(tag, msg) ::fretboard::Logger::instance().log(::fretboard::LogEntry::Level::Warning, (tag), (msg))
#define LOG_ERROR(tag, msg) ::fretboard::Logger::instance().log(::fretboard::LogEntry::Level::Error, (tag), (msg))
