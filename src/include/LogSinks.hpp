#pragma once

#include <spdlog/details/file_helper.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <concepts>
#include <filesystem>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

template <typename Mutex>
using base_sink = spdlog::sinks::base_sink<Mutex>;

// Keeps a sink attached to the default logger for the lifetime of the object.
template <std::derived_from<base_sink<std::mutex>> Sink>
struct RAIILogSink {
    RAIILogSink() = default;

    template <typename... Args>
    explicit RAIILogSink(Args&&... args)
        requires std::is_constructible_v<Sink, Args...> &&
                 (sizeof...(Args) != 0)
        : _sink(std::make_shared<Sink>(std::forward<Args>(args)...)) {
        spdlog::default_logger()->sinks().push_back(_sink);
    }

    ~RAIILogSink() { detach(); }

    RAIILogSink& operator=(std::shared_ptr<Sink>&& sink) & {
        detach();
        _sink = std::move(sink);
        if (_sink) {
            spdlog::default_logger()->sinks().push_back(_sink);
        }
        return *this;
    }

    RAIILogSink(const RAIILogSink&) = delete;
    RAIILogSink& operator=(const RAIILogSink&) = delete;

    [[nodiscard]] bool attached() const { return _sink != nullptr; }

   private:
    void detach() {
        if (!_sink) {
            return;
        }
        auto& sinks = spdlog::default_logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), _sink),
                    sinks.end());
        _sink.reset();
    }

    std::shared_ptr<Sink> _sink;
};

// Appends every record to a file. Throws spdlog::spdlog_ex if the file
// cannot be opened.
struct LogFileSink : base_sink<std::mutex> {
    explicit LogFileSink(const std::filesystem::path& filename) {
        file.open(filename.string(), false);
        LOG(INFO) << "File " << filename.string() << " added as logsink";
    }

    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        base_sink<std::mutex>::formatter_->format(msg, formatted);
        file.write(formatted);
    }

    void flush_() override { file.flush(); }

    ~LogFileSink() override = default;

   private:
    spdlog::details::file_helper file;
};
