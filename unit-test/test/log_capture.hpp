#pragma once

#include <glog/logging.h>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief 在作用域内收集 glog 输出的日志，用于检查错误是否被记录
 */
struct log_capture : public google::LogSink {
    explicit log_capture(google::LogSeverity min_severity = google::GLOG_ERROR)
        : min_severity(min_severity) {
        google::AddLogSink(this);
    }

    ~log_capture() override {
        google::RemoveLogSink(this);
    }

    void send(google::LogSeverity severity, const char * /* full_filename */,
              const char * /* base_filename */, int /* line */,
              const struct ::tm * /* tm_time */,
              const char *message, size_t message_len) override {
        if (severity < min_severity) return;
        std::scoped_lock guard(mut);
        messages.emplace_back(message, message_len);
    }

    std::vector<std::string> captured() {
        std::scoped_lock guard(mut);
        return messages;
    }

private:
    google::LogSeverity min_severity;
    std::mutex mut;
    std::vector<std::string> messages;
};
