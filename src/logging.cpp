#include "scheep/logging.hpp"

#include <utility>

namespace scheep {
namespace {

struct installed_sink {
    std::mutex mutex;
    std::shared_ptr<log_sink> sink;
};

installed_sink& process_sink() {
    static installed_sink installed;
    return installed;
}

}  // namespace

memory_log_sink::memory_log_sink(std::size_t capacity) : slots_(capacity) {}

void memory_log_sink::write(const log_record& rec) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++written_;
    if (slots_.empty()) {
        return;
    }

    log_record& slot = slots_[next_slot_];
    slot = rec;
    slot.sequence = written_;
    next_slot_ = (next_slot_ + 1) % slots_.size();
    if (filled_ < slots_.size()) {
        ++filled_;
    }
}

std::vector<log_record> memory_log_sink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<log_record> ordered;
    if (filled_ == 0) {
        return ordered;
    }
    ordered.reserve(filled_);
    const std::size_t oldest = (next_slot_ + slots_.size() - filled_) % slots_.size();
    for (std::size_t i = 0; i < filled_; ++i) {
        ordered.push_back(slots_[(oldest + i) % slots_.size()]);
    }
    return ordered;
}

std::size_t memory_log_sink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filled_;
}

void memory_log_sink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    next_slot_ = 0;
    filled_ = 0;
}

stream_log_sink::stream_log_sink(std::ostream& out, log_level min_level) : out_(out), min_level_(min_level) {}

void stream_log_sink::write(const log_record& rec) {
    if (rec.level < min_level_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << '[' << log_level_name(rec.level) << "] " << rec.category << ": " << rec.message << '\n';
}

const char* log_level_name(log_level level) noexcept {
    switch (level) {
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warn:
            return "warn";
        case log_level::error:
            return "error";
    }
    return "unknown";
}

void set_log_sink(std::shared_ptr<log_sink> sink) {
    installed_sink& installed = process_sink();
    std::lock_guard<std::mutex> lock(installed.mutex);
    installed.sink = std::move(sink);
}

std::shared_ptr<log_sink> current_log_sink() {
    installed_sink& installed = process_sink();
    std::lock_guard<std::mutex> lock(installed.mutex);
    return installed.sink;
}

void log_message(log_level level, const std::string& category, const std::string& message) {
    const std::shared_ptr<log_sink> sink = current_log_sink();
    if (!sink) {
        return;
    }
    sink->write(log_record{0, std::chrono::steady_clock::now(), level, category, message});
}

}  // namespace scheep
