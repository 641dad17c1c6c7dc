#include "logger.hpp"
#include "timeex.hpp"
#include <stdio.h>
#include <string.h>
#include <string>
#include <sstream>
#include <iostream>

Logger Logger::s_logger;
thread_local char Logger::buffer_[LOGGER_BUFFER_SIZE];

static const char* short_source_name(const char* filename) {
    const char* slash_p = strrchr(filename, '/');
    return slash_p ? slash_p + 1 : filename;
}

Logger::Logger(const std::string filename, enum LOGGER_LEVEL level):level_(level)
{
    set_filename(filename);
}

Logger::~Logger()
{
    close_file();
}

Logger* Logger::get_instance() {
    return &s_logger;
}

void Logger::close_file() {
    if (file_p_) {
        fclose(file_p_);
        file_p_ = nullptr;
    }
}

void Logger::set_filename(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if ((filename == filename_) && ((file_p_ != nullptr) || filename.empty())) {
        return;
    }
    close_file();
    filename_ = filename;
    if (filename_.empty()) {
        return;
    }

    file_p_ = fopen(filename_.c_str(), "ab");
    if (!file_p_) {
        std::cerr << "open log file:" << filename_ << " error, log to stdout\r\n";
    }
}

void Logger::set_level(enum LOGGER_LEVEL level) {
    level_ = level;
}

enum LOGGER_LEVEL Logger::get_level() {
    return level_;
}

char* Logger::get_buffer() {
    return buffer_;
}

void Logger::logf(const char* level, const char* buffer, const char* filename, int line) {
    std::stringstream ss;

    ss << "[" << level << "]" << "[" << get_now_str() << "]"
       << "[" << short_source_name(filename) << ":" << line << "]"
       << buffer << "\r\n";
    std::string log_line = ss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_p_ == nullptr) {
        std::cout << log_line;
        return;
    }
    if (fwrite(log_line.data(), 1, log_line.length(), file_p_) != log_line.length()) {
        std::cerr << "write log file:" << filename_ << " error\r\n";
        std::cout << log_line;
    }
    fflush(file_p_);
}
