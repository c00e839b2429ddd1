#define _FILE_OFFSET_BITS 64

#include "packguard/config.hpp"
#include "packguard/logger.hpp"
#include "packguard/pack_installer.hpp"
#include "packguard/pack_rules.hpp"
#include "packguard/pack_store.hpp"
#include "packguard/progress_sinks.hpp"
#include "packguard/registry.hpp"
#include "packguard/signals.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [global options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  install <pack-id> --file <archive>        Install a pack from a local archive\n"
        "  install <pack-id> --url <url> [--sha256 <hex>]\n"
        "                                            Download and install a pack\n"
        "  install-registry <pack-id>                Install a pack listed in the registry\n"
        "  list [<pack-id>]                          List installed packs, or one pack's sounds\n"
        "  registry                                  List packs offered by the registry\n"
        "  preview <pack-id>                         Print the path of a random sound\n"
        "  create <pack-id>                          Create an empty pack\n"
        "  uninstall <pack-id>                       Remove a pack\n"
        "  activate <pack-id>                        Make a pack the active one\n"
        "  add <pack-id> <event> <file>              Add one sound file to a pack\n"
        "  remove <pack-id> <event> <file>           Remove one sound file from a pack\n"
        "\n"
        "Global options:\n"
        "  -c, --config <path>    Config file (default $PACKGUARD_CONFIG or\n"
        "                         ~/.config/packguard/config.json)\n"
        "  -v, --verbose          Debug logging\n"
        "  -q, --quiet            Errors only\n"
        "  -h, --help             Show this help\n",
        argv);
}

struct Context {
    packguard::config::Settings settings;
    packguard::ConsoleProgressSink progress;

    packguard::PackLayout Layout() const { return packguard::PackLayout(settings.sounds_dir); }

    packguard::DownloadOptions Download() const {
        packguard::DownloadOptions d;
        d.connect_timeout_sec = static_cast<long>(settings.connect_timeout_sec);
        d.transfer_timeout_sec = static_cast<long>(settings.transfer_timeout_sec);
        return d;
    }

    packguard::PackInstaller Installer() {
        packguard::PackInstaller::Options opt;
        opt.max_extracted_bytes = settings.max_extracted_bytes;
        opt.download = Download();
        packguard::PackInstaller installer(Layout(), opt);
        if (settings.progress) installer.SetProgressSink(&progress);
        return installer;
    }
};

int Fail(const packguard::Result &r) {
    if (r.kind == packguard::ErrorKind::kCancelled && packguard::CancelSignal() != 0) {
        std::fprintf(stderr, "ERROR: %s (%s)\n", r.msg.c_str(), strsignal(packguard::CancelSignal()));
        return 1;
    }
    std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
    return 1;
}

bool ExpectArgs(const std::vector<std::string> &args, size_t n, const char *argv0) {
    if (args.size() != n) {
        PrintUsage(argv0);
        return false;
    }
    return true;
}

void AfterInstall(const packguard::PackStore &store) {
    std::string active;
    auto r = store.EnsureActivePack(active);
    if (!r.is_ok()) {
        LogWarn("Could not select an active pack: %s", r.msg.c_str());
    }
}

int CmdInstall(Context &ctx, int argc, char **argv, const char *argv0) {
    const char *file = nullptr;
    const char *url = nullptr;
    const char *sha = nullptr;

    static option long_opts[] = {
        {"file", required_argument, nullptr, 'f'},
        {"url", required_argument, nullptr, 'u'},
        {"sha256", required_argument, nullptr, 's'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "f:u:s:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'f': file = optarg; break;
            case 'u': url = optarg; break;
            case 's': sha = optarg; break;
            default:
                PrintUsage(argv0);
                return 2;
        }
    }

    if (optind + 1 != argc || (file == nullptr) == (url == nullptr) || (sha && !url)) {
        PrintUsage(argv0);
        return 2;
    }
    const std::string pack_id = argv[optind];

    auto installer = ctx.Installer();
    packguard::ValidationReport report;
    packguard::Result r = file ? installer.InstallFromFile(file, pack_id, &report)
                               : installer.InstallFromUrl(url, pack_id, sha ? sha : "", &report);
    if (!r.is_ok()) {
        if (r.kind == packguard::ErrorKind::kStructuralViolation) {
            for (const auto &line : report.Messages()) std::fprintf(stderr, "  %s\n", line.c_str());
        }
        return Fail(r);
    }

    AfterInstall(packguard::PackStore(ctx.Layout()));
    std::printf("Installed %s\n", pack_id.c_str());
    return 0;
}

int CmdInstallRegistry(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 1, argv0)) return 2;
    if (ctx.settings.registry_urls.empty()) {
        std::fprintf(stderr, "ERROR: no RegistryUrls configured\n");
        return 1;
    }

    packguard::Downloader downloader(ctx.Download());
    const auto reg = packguard::FetchMergedRegistry(ctx.settings.registry_urls, downloader);
    const auto *entry = reg.Find(args[0]);
    if (!entry) {
        std::fprintf(stderr, "ERROR: pack %s is not in the registry\n", args[0].c_str());
        return 1;
    }

    auto installer = ctx.Installer();
    packguard::ValidationReport report;
    auto r = installer.InstallFromUrl(entry->download_url, entry->id, entry->sha256, &report);
    if (!r.is_ok()) {
        if (r.kind == packguard::ErrorKind::kStructuralViolation) {
            for (const auto &line : report.Messages()) std::fprintf(stderr, "  %s\n", line.c_str());
        }
        return Fail(r);
    }

    AfterInstall(packguard::PackStore(ctx.Layout()));
    std::printf("Installed %s %s\n", entry->id.c_str(), entry->version.c_str());
    return 0;
}

int CmdList(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (args.size() > 1) {
        PrintUsage(argv0);
        return 2;
    }
    packguard::PackStore store(ctx.Layout());

    if (args.empty()) {
        const auto active = store.ActivePackId();
        for (const auto &id : store.InstalledPackIds()) {
            std::printf("%s %s\n", (active && *active == id) ? "*" : " ", id.c_str());
        }
        return 0;
    }

    for (const auto event : packguard::kEventNames) {
        std::vector<std::string> files;
        auto r = store.SoundFiles(args[0], event, files);
        if (!r.is_ok()) return Fail(r);
        std::printf("%.*s:\n", static_cast<int>(event.size()), event.data());
        for (const auto &f : files) std::printf("  %s\n", f.c_str());
    }
    return 0;
}

int CmdRegistry(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 0, argv0)) return 2;
    if (ctx.settings.registry_urls.empty()) {
        std::fprintf(stderr, "ERROR: no RegistryUrls configured\n");
        return 1;
    }

    packguard::Downloader downloader(ctx.Download());
    const auto reg = packguard::FetchMergedRegistry(ctx.settings.registry_urls, downloader);
    const auto installed = packguard::PackStore(ctx.Layout()).InstalledPackIds();

    for (const auto &p : reg.packs) {
        const bool is_installed = std::find(installed.begin(), installed.end(), p.id) != installed.end();
        std::printf("%-20s %-8s %-10s %s%s\n",
                    p.id.c_str(),
                    p.version.c_str(),
                    p.size.c_str(),
                    p.name.c_str(),
                    is_installed ? " [installed]" : "");
    }
    return 0;
}

int CmdPreview(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 1, argv0)) return 2;
    packguard::PackStore store(ctx.Layout());

    packguard::PackSnapshot snap;
    auto r = store.OpenSnapshot(args[0], snap);
    if (!r.is_ok()) return Fail(r);

    std::string rel;
    r = store.PickRandomSound(snap, rel);
    if (!r.is_ok()) return Fail(r);

    std::printf("%s/%s/%s\n", ctx.settings.sounds_dir.c_str(), args[0].c_str(), rel.c_str());
    return 0;
}

int CmdCreate(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 1, argv0)) return 2;
    packguard::PackStore store(ctx.Layout());
    auto r = store.CreatePack(args[0]);
    if (!r.is_ok()) return Fail(r);
    AfterInstall(store);
    return 0;
}

int CmdUninstall(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 1, argv0)) return 2;
    packguard::PackStore store(ctx.Layout());
    auto r = store.UninstallPack(args[0]);
    if (!r.is_ok()) return Fail(r);
    AfterInstall(store);
    return 0;
}

int CmdActivate(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 1, argv0)) return 2;
    auto r = packguard::PackStore(ctx.Layout()).SetActivePack(args[0]);
    return r.is_ok() ? 0 : Fail(r);
}

int CmdAdd(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 3, argv0)) return 2;
    auto r = packguard::PackStore(ctx.Layout()).AddSound(args[0], args[1], args[2]);
    return r.is_ok() ? 0 : Fail(r);
}

int CmdRemove(Context &ctx, const std::vector<std::string> &args, const char *argv0) {
    if (!ExpectArgs(args, 3, argv0)) return 2;
    auto r = packguard::PackStore(ctx.Layout()).RemoveSound(args[0], args[1], args[2]);
    return r.is_ok() ? 0 : Fail(r);
}

} // namespace

int main(int argc, char **argv) {
    if (!packguard::InstallSignalHandlers()) return 1;

    std::string config_path;
    bool verbose = false;
    bool quiet = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // '+' stops at the command name so its own options are left alone.
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+c:vqh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c':
                config_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'q':
                quiet = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    Context ctx;
    bool must_exist = false;
    const std::string resolved = packguard::config::ResolveConfigPath(config_path, must_exist);
    if (auto r = packguard::config::LoadSettings(resolved, must_exist, ctx.settings); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    auto level = ctx.settings.log_level;
    if (verbose) level = packguard::LogLevel::Debug;
    if (quiet) level = packguard::LogLevel::Error;
    packguard::Logger::Instance().SetLevel(level);
    if (!ctx.settings.log_file.empty()) {
        if (auto r = packguard::Logger::Instance().SetOutputFile(ctx.settings.log_file); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    }
    LogDebug("Config: %s, sounds dir: %s", resolved.c_str(), ctx.settings.sounds_dir.c_str());

    const std::string cmd = argv[optind];
    const int sub_argc = argc - optind;
    char **sub_argv = argv + optind;
    const std::vector<std::string> args(argv + optind + 1, argv + argc);

    if (cmd == "install") return CmdInstall(ctx, sub_argc, sub_argv, argv[0]);
    if (cmd == "install-registry") return CmdInstallRegistry(ctx, args, argv[0]);
    if (cmd == "list") return CmdList(ctx, args, argv[0]);
    if (cmd == "registry") return CmdRegistry(ctx, args, argv[0]);
    if (cmd == "preview") return CmdPreview(ctx, args, argv[0]);
    if (cmd == "create") return CmdCreate(ctx, args, argv[0]);
    if (cmd == "uninstall") return CmdUninstall(ctx, args, argv[0]);
    if (cmd == "activate") return CmdActivate(ctx, args, argv[0]);
    if (cmd == "add") return CmdAdd(ctx, args, argv[0]);
    if (cmd == "remove") return CmdRemove(ctx, args, argv[0]);

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    PrintUsage(argv[0]);
    return 2;
}
