#include "GTS.hpp"
#include "ConfigReader.hpp"
#include "IscSetup.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "gts_biot - Biot poroelasticity with fracture contact mechanics\n"
                    "          for the ISC stimulation experiment (Grimsel Test Site)\n"
                    "Usage: gts_biot [options]\n\n"
                    "Options:\n"
                    "  -c <file>                  Configuration file (.config)\n"
                    "  -generate_config <file>    Write a template configuration\n"
                    "  -convergence_study <n>     Run on n uniform refinements of the mesh\n"
                    "  -mechanics                 Stationary contact mechanics instead of Biot\n"
                    "  -ksp_type <type>           Linear solver override: preonly, gmres\n"
                    "  -pc_type <type>            Preconditioner override: lu, ilu, gamg\n\n"
                    "Examples:\n"
                    "  gts_biot -c config/isc_biot.config\n"
                    "  gts_biot -c config/isc_biot.config -convergence_study 2\n"
                    "  gts_biot -c config/isc_biot.config -mechanics\n"
                    "  gts_biot -generate_config my_run.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            int status = 0;
            if (rank == 0) {
                try {
                    GTS::ConfigReader::generateTemplate(generate_config);
                    PetscPrintf(PETSC_COMM_SELF, "Configuration template written to: %s\n",
                                generate_config);
                } catch (const std::exception& e) {
                    PetscPrintf(PETSC_COMM_SELF, "\nError: %s\n", e.what());
                    status = 1;
                }
            }
            MPI_Bcast(&status, 1, MPI_INT, 0, comm);
            ierr = PetscFinalize();
            return status;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscInt n_refinements = 0;
        PetscBool study = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-convergence_study", &n_refinements,
                                  &study); CHKERRQ(ierr);
        PetscBool mechanics = PETSC_FALSE;
        ierr = PetscOptionsHasName(nullptr, nullptr, "-mechanics", &mechanics); CHKERRQ(ierr);
        const GTS::ModelKind kind = mechanics ? GTS::ModelKind::MECHANICS : GTS::ModelKind::BIOT;

        if (!config_provided) {
            PetscPrintf(comm, "Error: Configuration file (-c) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: gts_biot -generate_config template.config\n");
            ierr = PetscFinalize();
            return 1;
        }

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  GTS - Contact mechanics Biot model of the ISC experiment\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "Config file:   %s\n", config_file);

        try {
            GTS::ConfigReader reader;
            if (!reader.loadFile(config_file)) {
                PetscPrintf(comm, "Error: Cannot read configuration file %s\n", config_file);
                ierr = PetscFinalize();
                return 1;
            }

            GTS::ConfigReader::ValidationResult check = reader.validate();
            for (const auto& w : check.warnings) {
                PetscPrintf(comm, "Warning: %s\n", w.c_str());
            }
            if (!check.valid) {
                for (const auto& e : check.errors) {
                    PetscPrintf(comm, "Error: %s\n", e.c_str());
                }
                ierr = PetscFinalize();
                return 1;
            }

            GTS::SimulationConfig config;
            reader.parseSimulationConfig(config);
            PetscPrintf(comm, "Output folder: %s\n", config.output.viz_folder.c_str());
            PetscPrintf(comm, "\n");

            double start_time = MPI_Wtime();
            if (study) {
                PetscPrintf(comm, "Starting convergence study with %d refinements...\n",
                            static_cast<int>(n_refinements));
                PetscPrintf(comm, "------------------------------------------------------------\n");
                auto summaries = GTS::convergenceStudy(config, static_cast<int>(n_refinements), comm,
                                                       kind);
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "%6s %10s %10s %8s %16s\n", "level", "cells", "dofs", "steps",
                            "slip tendency");
                for (size_t k = 0; k < summaries.size(); ++k) {
                    PetscPrintf(comm, "%6d %10d %10d %8d %16.6e\n", static_cast<int>(k),
                                summaries[k].num_cells, summaries[k].num_dofs, summaries[k].steps,
                                summaries[k].max_slip_tendency);
                }
            } else {
                PetscPrintf(comm, "Starting simulation...\n");
                PetscPrintf(comm, "------------------------------------------------------------\n");
                GTS::RunSummary summary = kind == GTS::ModelKind::MECHANICS
                                              ? GTS::runMechanicsModel(config, comm)
                                              : GTS::runBiotModel(config, comm);
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Time steps:          %d\n", summary.steps);
                PetscPrintf(comm, "End time:            %g\n", summary.end_time);
                PetscPrintf(comm, "Cells:               %d\n", summary.num_cells);
                PetscPrintf(comm, "Max slip tendency:   %g\n", summary.max_slip_tendency);
            }
            double end_time = MPI_Wtime();

            PetscPrintf(comm, "Simulation completed successfully!\n");
            PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);
            PetscPrintf(comm, "Output files written to: %s\n", config.output.viz_folder.c_str());
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");

        } catch (const std::exception& e) {
            PetscPrintf(comm, "\nError: %s\n", e.what());
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return 0;
}
