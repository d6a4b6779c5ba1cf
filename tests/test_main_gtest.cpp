/**
 * @file test_main_gtest.cpp
 * @brief Entry point of the GTS test suite
 *
 * Tests write their scratch folders (gts_test_*) below the working
 * directory; ctest runs them from the build tree.
 */

#include <gtest/gtest.h>
#include <mpi.h>
#include <petsc.h>

static char help[] = "GTS unit, functional and integration tests\n";

int main(int argc, char **argv) {
    MPI_Init(&argc, &argv);

    // PETSc also parses its own options (-ksp_view, -log_view, ...)
    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, help);
    if (ierr) {
        MPI_Finalize();
        return static_cast<int>(ierr);
    }

    ::testing::InitGoogleTest(&argc, argv);

    int rank;
    MPI_Comm_rank(PETSC_COMM_WORLD, &rank);

    // Results are printed by rank 0 only
    if (rank != 0) {
        ::testing::TestEventListeners& listeners =
            ::testing::UnitTest::GetInstance()->listeners();
        delete listeners.Release(listeners.default_result_printer());
    }

    int result = RUN_ALL_TESTS();

    PetscFinalize();
    MPI_Finalize();

    return result;
}
