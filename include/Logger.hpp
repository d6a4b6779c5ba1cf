#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "GTS.hpp"
#include <fstream>
#include <sstream>
#include <string>

namespace GTS {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Run logger writing to the console and a results.log file
 *
 * Records are formatted as
 *   YYYY-MM-DD HH:MM:SS LEVEL:source:message
 *
 * Console output goes through PetscPrintf on the logger's communicator, so
 * only rank 0 prints. The file receives everything at or above its own
 * level (DEBUG by default) and is flushed after every record so a crashed
 * run still leaves its log behind.
 */
class Logger {
public:
    explicit Logger(MPI_Comm comm = PETSC_COMM_WORLD);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Open (append) the log file; creates parent directories
    void openFile(const std::string& path);
    void closeFile();
    bool hasFile() const { return file_.is_open(); }
    const std::string& filePath() const { return file_path_; }

    void setConsoleLevel(LogLevel level) { console_level_ = level; }
    void setFileLevel(LogLevel level) { file_level_ = level; }

    void log(LogLevel level, const std::string& source, const std::string& message);

    void debug(const std::string& source, const std::string& message) {
        log(LogLevel::DEBUG, source, message);
    }
    void info(const std::string& source, const std::string& message) {
        log(LogLevel::INFO, source, message);
    }
    void warning(const std::string& source, const std::string& message) {
        log(LogLevel::WARNING, source, message);
    }
    void error(const std::string& source, const std::string& message) {
        log(LogLevel::ERROR, source, message);
    }

    static std::string levelName(LogLevel level);
    static std::string timestamp();
    static std::string format(LogLevel level, const std::string& source,
                              const std::string& message);

private:
    MPI_Comm comm_;
    int rank_ = 0;
    std::ofstream file_;
    std::string file_path_;
    LogLevel console_level_ = LogLevel::INFO;
    LogLevel file_level_ = LogLevel::DEBUG;
};

} // namespace GTS

#endif // LOGGER_HPP
