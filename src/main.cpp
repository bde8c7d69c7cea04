#include "BlendSim.hpp"
#include "PerformanceRun.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <exception>
#include <string>

static char help[] = "BlendSim - E10 vs E20 Spark-Ignition Engine Performance Comparison\n"
                    "Usage: blendsim [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -o <dir>                 Output directory (default: .)\n"
                    "  -basename <name>         Output base filename (default: E10_E20_PerformanceGraphs)\n"
                    "  -rpm_start <rpm>         First engine speed\n"
                    "  -rpm_end <rpm>           Last engine speed (inclusive)\n"
                    "  -rpm_step <rpm>          Engine speed increment\n"
                    "  -noise <fraction>        Measurement noise, 0 disables (default: 0.02)\n"
                    "  -seed <int>              Noise generator seed (default: 1)\n"
                    "  -no_plots                Write gnuplot script and data without running gnuplot\n"
                    "  -generate_config <file>  Write a template configuration and exit\n\n"
                    "Examples:\n"
                    "  blendsim\n"
                    "  blendsim -c config/e10_e20.config -o output\n"
                    "  blendsim -noise 0 -rpm_start 1500 -rpm_end 4500 -rpm_step 250\n\n";

static const char* const RULE_HEAVY = "============================================================\n";
static const char* const RULE_LIGHT = "------------------------------------------------------------\n";

// Writes the template on rank 0; status is 1 when the file cannot be written
static PetscErrorCode writeTemplate(MPI_Comm comm, int rank, const char* path, int* status) {
    PetscFunctionBeginUser;
    *status = 0;
    if (rank == 0) {
        if (BlendSim::ConfigReader::generateTemplate(path)) {
            PetscPrintf(comm, "Configuration template written to: %s\n", path);
            PetscPrintf(comm, "Edit this file to customize the engine and sweep.\n");
        } else {
            PetscPrintf(comm, "Error: cannot write configuration template: %s\n", path);
            *status = 1;
        }
    }
    PetscFunctionReturn(0);
}

static void printBanner(MPI_Comm comm, const char* config_file) {
    PetscPrintf(comm, "\n%s", RULE_HEAVY);
    PetscPrintf(comm, "  BlendSim - E10 vs E20 Engine Performance Simulation\n");
    PetscPrintf(comm, "  Version %s\n", BLENDSIM_VERSION);
    PetscPrintf(comm, "%s\n", RULE_HEAVY);
    PetscPrintf(comm, "Config file:   %s\n\n", config_file ? config_file : "(built-in defaults)");
}

static PetscErrorCode runComparison(MPI_Comm comm, int rank, const char* config_file) {
    PetscErrorCode ierr;
    PetscFunctionBeginUser;

    BlendSim::PerformanceRun run(comm);

    if (config_file) {
        ierr = run.initializeFromConfigFile(config_file); CHKERRQ(ierr);
    } else {
        ierr = run.initialize(BlendSim::RunConfig()); CHKERRQ(ierr);
    }
    ierr = run.setFromOptions(); CHKERRQ(ierr);
    ierr = run.setup(); CHKERRQ(ierr);

    if (rank == 0) {
        PetscPrintf(comm, "\nComputing performance curves...\n%s", RULE_LIGHT);
    }

    double t0 = MPI_Wtime();
    ierr = run.run(); CHKERRQ(ierr);
    double elapsed = MPI_Wtime() - t0;

    ierr = run.writeSummary(); CHKERRQ(ierr);

    if (rank == 0) {
        PetscPrintf(comm, "%s", RULE_LIGHT);
        PetscPrintf(comm, "Computation completed in %.6f seconds\n\n", elapsed);
        PetscPrintf(comm, "Exporting comparison figure...\n");
    }

    ierr = run.generatePlots(); CHKERRQ(ierr);

    if (rank == 0) {
        PetscPrintf(comm, "Simulation complete. Output written to: %s\n",
                    run.getConfig().output.directory.c_str());
        PetscPrintf(comm, "%s", RULE_HEAVY);
    }

    PetscFunctionReturn(0);
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;
    int status = 0;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char path[PETSC_MAX_PATH_LEN] = "";
        PetscBool flg = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", path,
                                     sizeof(path), &flg); CHKERRQ(ierr);
        if (flg) {
            ierr = writeTemplate(comm, rank, path, &status); CHKERRQ(ierr);
            ierr = PetscFinalize();
            return status;
        }

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", path,
                                     sizeof(path), &flg); CHKERRQ(ierr);
        const char* config_file = flg ? path : nullptr;

        if (rank == 0) printBanner(comm, config_file);

        try {
            ierr = runComparison(comm, rank, config_file); CHKERRQ(ierr);
        } catch (const std::exception& e) {
            // Anything the driver did not convert to a PETSc error
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            status = 1;
        }
    }

    ierr = PetscFinalize();
    return status ? status : ierr;
}
