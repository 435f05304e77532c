#include <pgbulk/config/job_file.hpp>
#include <pgbulk/errors.hpp>
#include <pgbulk/load/job.hpp>
#include <iostream>
#include <string>

using namespace PgBulk;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <job.json> [--force-staging] [--quiet]\n";
        std::cerr << "\nConnection comes from the job file's 'connection' key or PGHOST/PGPORT/PGDATABASE/PGUSER/PGPASSWORD.\n";
        return 1;
    }

    std::string job_path;
    bool force_staging = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--force-staging") force_staging = true;
        else if (arg == "--quiet") quiet = true;
        else if (job_path.empty()) job_path = arg;
        else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    try {
        JobFile file = load_job_file(job_path);
        if (force_staging) file.config.force_staging = true;
        if (quiet) file.config.quiet = true;

        Job job(file.config);
        for (const auto& reg : file.files) {
            job.register_files(reg.directory, reg.pattern);
        }

        LoadReport report = job.start();
        job.end();

        if (!quiet) {
            std::cout << "\n=== Load Complete ===\n"
                      << "Files: " << report.files << "\n"
                      << "Rows copied: " << report.rows_copied << "\n"
                      << "Strategy: " << (report.used_staging ? "staging table" : "direct COPY") << "\n"
                      << "Indexes rebuilt: " << report.indexes_rebuilt << "\n"
                      << "Constraints rebuilt: " << report.constraints_rebuilt << "\n"
                      << "Elapsed: " << report.elapsed_ms << " ms\n";
        }
        return 0;
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
