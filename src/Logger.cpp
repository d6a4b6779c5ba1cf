#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <stdexcept>

namespace GTS {

Logger::Logger(MPI_Comm comm) : comm_(comm) {
    MPI_Comm_rank(comm_, &rank_);
}

Logger::~Logger() {
    closeFile();
}

void Logger::openFile(const std::string& path) {
    closeFile();

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    if (rank_ != 0) {
        file_path_ = path;
        return;
    }

    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    file_path_ = path;
}

void Logger::closeFile() {
    if (file_.is_open()) {
        file_.close();
    }
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string Logger::format(LogLevel level, const std::string& source,
                           const std::string& message) {
    return timestamp() + " " + levelName(level) + ":" + source + ":" + message;
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    const bool to_console = level >= console_level_;
    const bool to_file = file_.is_open() && level >= file_level_;
    if (!to_console && !to_file) return;

    const std::string record = format(level, source, message);

    if (to_console) {
        PetscPrintf(comm_, "%s\n", record.c_str());
    }
    if (to_file) {
        file_ << record << "\n";
        file_.flush();
    }
}

} // namespace GTS
