#ifndef SIMULATION_CONTEXT_HPP
#define SIMULATION_CONTEXT_HPP

#include "GTS.hpp"
#include "Logger.hpp"
#include <string>

namespace GTS {

/**
 * @brief Explicit run context handed to every component that logs or writes
 *
 * Owns the communicator handle, the output folder and the logger. The
 * output folder is created on construction and the log file is opened
 * inside it.
 */
class SimulationContext {
public:
    SimulationContext(MPI_Comm comm, const std::string& output_folder,
                      const std::string& log_file = "results.log");

    MPI_Comm comm() const { return comm_; }
    int rank() const { return rank_; }
    int size() const { return size_; }

    const std::string& outputFolder() const { return output_folder_; }
    std::string outputPath(const std::string& file_name) const;

    Logger& logger() { return logger_; }

private:
    MPI_Comm comm_;
    int rank_ = 0;
    int size_ = 1;
    std::string output_folder_;
    Logger logger_;
};

} // namespace GTS

#endif // SIMULATION_CONTEXT_HPP
