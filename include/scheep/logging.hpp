#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace scheep {

enum class log_level {
    debug,
    info,
    warn,
    error
};

struct log_record {
    std::uint64_t sequence = 0;
    std::chrono::steady_clock::time_point ts{};
    log_level level = log_level::info;
    std::string category;
    std::string message;
};

class log_sink {
public:
    virtual ~log_sink() = default;
    virtual void write(const log_record& rec) = 0;
};

// Keeps the newest `capacity` records. Sequence numbers count every write,
// including those already overwritten.
class memory_log_sink final : public log_sink {
public:
    explicit memory_log_sink(std::size_t capacity);

    void write(const log_record& rec) override;
    [[nodiscard]] std::vector<log_record> snapshot() const;  // oldest first
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
    void clear();

private:
    std::vector<log_record> slots_;
    std::size_t next_slot_ = 0;
    std::size_t filled_ = 0;
    std::uint64_t written_ = 0;
    mutable std::mutex mutex_;
};

// Writes "[level] category: message" lines at or above min_level.
class stream_log_sink final : public log_sink {
public:
    stream_log_sink(std::ostream& out, log_level min_level);

    void write(const log_record& rec) override;

private:
    std::ostream& out_;
    log_level min_level_;
    std::mutex mutex_;
};

const char* log_level_name(log_level level) noexcept;

// Process-wide sink. With no sink installed, messages are dropped.
void set_log_sink(std::shared_ptr<log_sink> sink);
std::shared_ptr<log_sink> current_log_sink();
void log_message(log_level level, const std::string& category, const std::string& message);

}  // namespace scheep
