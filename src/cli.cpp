/**
 * @file cli.cpp
 * @brief ppf-info command line interface.
 *
 * Reads a Hyades post-processor file, prints a summary of the run and the
 * result of the import checks.
 *
 * @see Hyades User's Guide Version PP.11.xx, Appendix IV
 */

#include <ppf/ppf.hpp>

#include <cstdio>
#include <cstring>
#include <string>

using namespace ppf;

static void print_version() {
    std::printf("ppf-info %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nHyades post-processor dump reader (v%s)\n", version());
    std::printf("=========================================\n\n");
    std::printf("Reads .ppf files written by Hyades (dump format PP.11.xx).\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <file.ppf>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  --strict       Fail on the first dump that cannot be decoded\n");
    std::printf("  -q, --quiet    Only log errors\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s run.ppf\n", prog_name);
    std::printf("  %s --strict run.ppf\n\n", prog_name);
}

static int do_info(const char* input_path, bool strict) {
    LoadOptions options;
    options.strict = strict;

    DumpCollection dumps;
    Error result = DumpCollection::load(input_path, dumps, options);
    if (result != Error::Ok) {
        const char* action = (result == Error::IoError) ? "read" : "decode";
        std::fprintf(stderr, "Error: Cannot %s %s: %s\n", action, input_path,
                     error_string(result));
        return 1;
    }

    const LoadReport& report = dumps.load_report();
    std::printf("Input:    %s (%zu bytes)\n", input_path, report.bytes_total);
    if (!report.complete()) {
        std::printf("Stopped:  %zu/%zu bytes (%s)\n", report.bytes_consumed, report.bytes_total,
                    error_string(report.stop_reason));
    }
    std::printf("%s", dumps.summary().c_str());

    std::printf("\nRunning validation checks\n");
    for (const auto& message : dumps.validate()) {
        std::printf("  %s\n", message.c_str());
    }
    std::printf("...done\n");

    return 0;
}

int main(int argc, char** argv) {
    bool strict = false;
    const char* input_path = nullptr;

    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--quiet") == 0) {
            logger()->set_level(spdlog::level::err);
        } else if (std::strcmp(argv[i], "--strict") == 0) {
            strict = true;
        } else if (input_path == nullptr) {
            input_path = argv[i];
        } else {
            std::fprintf(stderr, "Error: Unexpected argument: %s\n", argv[i]);
            std::fprintf(stderr, "Usage: %s [options] <file.ppf>\n", argv[0]);
            return 1;
        }
    }

    if (input_path == nullptr) {
        std::fprintf(stderr, "Error: No input file given\n");
        std::fprintf(stderr, "Usage: %s [options] <file.ppf>\n", argv[0]);
        return 1;
    }

    return do_info(input_path, strict);
}
