#include "pati/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pati::log {

namespace {
std::atomic<quill::Logger*> g_logger{nullptr};
std::mutex g_initMutex;

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void start(const char* log_file_path) {
    std::lock_guard<std::mutex> lock(g_initMutex);
    auto* current = g_logger.load();
    if (current && log_file_path == nullptr) {
        return;
    }

    if (!current) {
        quill::BackendOptions backend_opts;
        backend_opts.thread_name = "PatiLog";
        backend_opts.wait_for_queues_to_empty_before_exit = true;

        quill::Backend::start(backend_opts);
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    std::string name = "pati";
    if (log_file_path != nullptr) {
        sinks.push_back(makeFileSink(log_file_path));
        // Quill loggers keep their sinks for life, so a file sink means a new
        // logger that takes over from the current one.
        name += ":" + std::string(log_file_path);
    }

    auto* created = quill::Frontend::create_or_get_logger(name, std::move(sinks), makePattern());
    created->set_log_level(current ? current->get_log_level() : quill::LogLevel::Info);
    g_logger.store(created);
}

} // namespace

void init() {
    start(nullptr);
}

void init(const char* log_file_path) {
    start(log_file_path);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_initMutex);
    if (auto* lg = g_logger.load()) {
        lg->flush_log();
    }
    quill::Backend::stop();
}

void flush() {
    logger()->flush_log();
}

quill::Logger* logger() {
    if (!g_logger.load()) {
        start(nullptr);
    }
    return g_logger.load();
}

void setLevel(quill::LogLevel level) {
    if (auto* lg = logger()) {
        lg->set_log_level(level);
    }
}

} // namespace pati::log
