#define _FILE_OFFSET_BITS 64

#include "packguard/logger.hpp"
#include "packguard/pack_installer.hpp"
#include "packguard/signals.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-v] [-m <bytes>] <archive> <pack-id>\n"
        "\n"
        "Checks a sound pack archive without installing it. Prints one line per\n"
        "problem and exits 0 on pass, 1 on failure, 2 on usage errors.\n"
        "\n"
        "Options:\n"
        "  -m, --max-bytes   Extraction limit in bytes (default 268435456)\n"
        "  -v, --verbose     Debug logging to stderr\n"
        "  -h, --help        Show this help\n",
        argv);
}

std::string ScratchParent() {
    const char *tmp = std::getenv("TMPDIR");
    return (tmp && *tmp) ? std::string(tmp) : std::string("/tmp");
}

} // namespace

int main(int argc, char **argv) {
    if (!packguard::InstallSignalHandlers()) return 1;

    packguard::PackValidator::Options opt{};
    bool verbose = false;

    static option long_opts[] = {
        {"max-bytes", required_argument, nullptr, 'm'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvm:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'v':
                verbose = true;
                break;

            case 'm': {
                // strtoull accepts "-1" (wrapping) and "" (as 0).
                char *end = nullptr;
                errno = 0;
                unsigned long long v = std::strtoull(optarg, &end, 10);
                if (optarg[0] < '0' || optarg[0] > '9' || !end || *end != '\0' || errno == ERANGE) {
                    std::fprintf(stderr, "Invalid --max-bytes: %s\n", optarg);
                    return 2;
                }
                opt.max_extracted_bytes = static_cast<std::uint64_t>(v);
                break;
            }

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (argc - optind != 2) {
        PrintUsage(argv[0]);
        return 2;
    }

    packguard::Logger::Instance().SetLevel(verbose ? packguard::LogLevel::Debug : packguard::LogLevel::None);

    const std::string archive = argv[optind];
    const std::string pack_id = argv[optind + 1];

    packguard::PackValidator validator(opt);
    const auto outcome = validator.Validate(archive, pack_id, ScratchParent());
    if (outcome.Passed()) return 0;

    for (const auto &line : outcome.Messages()) {
        std::printf("%s\n", line.c_str());
    }
    return 1;
}
