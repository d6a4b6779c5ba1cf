#include "SimulationContext.hpp"
#include <filesystem>

namespace GTS {

SimulationContext::SimulationContext(MPI_Comm comm, const std::string& output_folder,
                                     const std::string& log_file)
    : comm_(comm), output_folder_(output_folder), logger_(comm) {
    MPI_Comm_rank(comm_, &rank_);
    MPI_Comm_size(comm_, &size_);

    if (!output_folder_.empty()) {
        std::filesystem::create_directories(output_folder_);
    }
    if (!log_file.empty()) {
        logger_.openFile(outputPath(log_file));
    }
}

std::string SimulationContext::outputPath(const std::string& file_name) const {
    if (output_folder_.empty()) return file_name;
    return (std::filesystem::path(output_folder_) / file_name).string();
}

} // namespace GTS
