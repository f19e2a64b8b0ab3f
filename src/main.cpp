// main.cpp - Main entry point
#include <getopt.h>
#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include "conf/config.hpp"
#include "conf/profiles.hpp"
#include "core/cancel.hpp"
#include "core/errors.hpp"
#include "core/executor.hpp"
#include "core/hooks.hpp"
#include "core/identify.hpp"
#include "core/metadata.hpp"
#include "core/pipeline.hpp"
#include "core/report.hpp"
#include "core/router.hpp"
#include "core/verifier.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace offload;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path profiles_file;
    fs::path staging_root;
    bool delete_after_verify = false;
    bool skip_confirmation = false;
    bool verbose = false;
    std::string output;
    std::vector<std::string> args;
};

static CancellationToken g_cancel;

static void handle_signal(int) {
    g_cancel.cancel();
}

static void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static void print_help() {
    std::cout << "Usage: offload [OPTIONS] <command> [args...]\n\n";
    std::cout << "Main Commands:\n";
    std::cout << "  run <source> [store_root]   Identify, copy, verify and optionally\n";
    std::cout << "                              clean up a mounted card\n";
    std::cout << "  identify <source>           Identify the camera only\n";
    std::cout << "  verify <source> <day_folder> <profile>\n";
    std::cout << "                              Compare a card against an imported day-folder\n";
    std::cout << "  profiles                    List camera profiles\n\n";

    std::cout << "Configuration Commands (config <subcommand>):\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -P, --profiles FILE     Camera profiles file\n";
    std::cout << "  -s, --staging DIR       Local staging root\n";
    std::cout << "  -d, --delete            Delete source files after verification\n";
    std::cout << "  -y, --yes               Skip the confirmation prompt\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  offload run /media/sdcard              # Offload to the configured store\n";
    std::cout << "  offload -d run /media/sdcard /mnt/nas  # Offload and clear the card\n";
    std::cout << "  offload identify /media/sdcard         # Which camera is this?\n";
    std::cout << "  offload config show                    # Show configuration\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"profiles", required_argument, 0, 'P'},
                                           {"staging", required_argument, 0, 's'},
                                           {"delete", no_argument, 0, 'd'},
                                           {"yes", no_argument, 0, 'y'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"output", required_argument, 0, 'o'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:P:s:dyvo:h", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'P':
            opts.profiles_file = optarg;
            break;
        case 's':
            opts.staging_root = optarg;
            break;
        case 'd':
            opts.delete_after_verify = true;
            break;
        case 'y':
            opts.skip_confirmation = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'h':
            print_help();
            exit(EXIT_OK);
        default:
            print_help();
            exit(EXIT_USAGE);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts, const fs::path& store_override = {}) {
    Config config =
        opts.config_file.empty() ? Config::load_default() : Config::from_file(opts.config_file);
    config.merge_with_cli(opts.profiles_file, store_override, opts.staging_root,
                          opts.delete_after_verify, opts.skip_confirmation, opts.verbose);
    return config;
}

static ProfileSet load_profile_set(const Config& config) {
    auto profiles = load_profiles(config.profiles_file);
    LOG_DEBUG("Loaded " + std::to_string(profiles.size()) + " camera profiles from " +
              config.profiles_file.string());
    return share_profiles(std::move(profiles));
}

static void print_config(const Config& config) {
    std::cout << "{\n";
    std::cout << "  \"profiles_file\": \"" << json_escape(config.profiles_file.string()) << "\",\n";
    std::cout << "  \"store_root\": \"" << json_escape(config.store_root.string()) << "\",\n";
    std::cout << "  \"staging_root\": \"" << json_escape(config.staging_root.string())
              << "\",\n";
    std::cout << "  \"store_host\": \"" << json_escape(config.store_host) << "\",\n";
    std::cout << "  \"store_port\": " << config.store_port << ",\n";
    std::cout << "  \"probe_timeout_ms\": " << config.probe_timeout_ms << ",\n";
    std::cout << "  \"delete_after_verify\": " << (config.delete_after_verify ? "true" : "false")
              << ",\n";
    std::cout << "  \"transfer_retries\": " << config.transfer_retries << ",\n";
    std::cout << "  \"retry_backoff_ms\": " << config.retry_backoff_ms << ",\n";
    std::cout << "  \"digest_workers\": " << config.digest_workers << ",\n";
    std::cout << "  \"metadata_samples\": " << config.metadata_samples << ",\n";
    std::cout << "  \"confidence_threshold\": " << config.confidence_threshold << ",\n";
    std::cout << "  \"metadata_reader\": \"" << json_escape(config.metadata_reader) << "\",\n";
    std::cout << "  \"audit_dir\": \"" << json_escape(config.audit_dir.string()) << "\",\n";
    std::cout << "  \"report_file\": \"" << json_escape(config.report_file.string()) << "\",\n";
    std::cout << "  \"notify_command\": \"" << json_escape(config.notify_command) << "\",\n";
    std::cout << "  \"require_confirmation\": "
              << (config.require_confirmation ? "true" : "false") << ",\n";
    std::cout << "  \"log_file\": \"" << json_escape(config.log_file.string()) << "\",\n";
    std::cout << "  \"verbose\": " << (config.verbose ? "true" : "false") << "\n";
    std::cout << "}\n";
}

static void print_profiles(const ProfileSet& profiles) {
    for (const auto& profile : profiles) {
        std::cout << profile->name << "\n";
        for (const auto& rule : profile->folder_rules) {
            std::cout << "  folder   " << rule.path << (rule.required ? " (required)" : "")
                      << "\n";
        }
        for (const auto& rule : profile->pattern_rules) {
            std::cout << "  pattern  " << rule.pattern << " +" << rule.confidence << "\n";
        }
        for (const auto& tree : profile->sources) {
            std::cout << "  " << source_kind_to_string(tree.kind) << "    " << tree.path << " :";
            for (const auto& ext : tree.extensions) {
                std::cout << " " << ext;
            }
            std::cout << "\n";
        }
        std::cout << "  destination " << profile->destination_template << "\n";
    }
}

// At most one line a second, plus the last file
static ProgressCallback make_progress_logger() {
    auto last = std::make_shared<std::chrono::steady_clock::time_point>();
    return [last](const TransferProgress& p) {
        auto now = std::chrono::steady_clock::now();
        if (p.files_done < p.files_total && now - *last < std::chrono::seconds(1)) {
            return;
        }
        *last = now;
        LOG_INFO("Transferred " + std::to_string(p.files_done) + "/" +
                 std::to_string(p.files_total) + " files, " + format_size(p.bytes_done) + " of " +
                 format_size(p.bytes_total) + ", " +
                 format_size(static_cast<uint64_t>(p.bytes_per_second)) + "/s");
    };
}

static int cmd_run(const CliOptions& cli) {
    if (cli.args.empty()) {
        std::cerr << "Usage: offload run <source> [store_root]\n";
        return EXIT_USAGE;
    }
    fs::path source = cli.args[0];
    fs::path store_override = cli.args.size() > 1 ? fs::path(cli.args[1]) : fs::path();

    Config config = load_config(cli, store_override);
    Logger::getInstance().init(config.verbose, config.log_file);
    config.validate();

    ProfileSet profiles = load_profile_set(config);
    auto reader = make_metadata_reader(config.metadata_reader);
    TcpStoreProbe probe(config.store_host, config.store_port, config.probe_timeout_ms,
                        config.store_root);

    std::unique_ptr<CommandNotifier> notifier;
    if (!config.notify_command.empty()) {
        notifier = std::make_unique<CommandNotifier>(config.notify_command);
    }
    std::unique_ptr<TerminalConfirmationGate> gate;
    if (config.require_confirmation) {
        gate = std::make_unique<TerminalConfirmationGate>(std::cin, std::cerr);
    }

    Collaborators hooks;
    hooks.gate = gate.get();
    hooks.notifier = notifier.get();
    hooks.token = &g_cancel;
    hooks.progress = make_progress_logger();

    install_signal_handlers();
    Orchestrator orchestrator(config, profiles, *reader, probe, hooks);
    RunReport report = orchestrator.run(source);

    std::cout << report.to_json();
    if (!config.report_file.empty() && report.save(config.report_file)) {
        LOG_INFO("Run report written to " + config.report_file.string());
    }
    return report.exit_code();
}

static int cmd_identify(const CliOptions& cli) {
    if (cli.args.empty()) {
        std::cerr << "Usage: offload identify <source>\n";
        return EXIT_USAGE;
    }

    Config config = load_config(cli);
    Logger::getInstance().init(config.verbose, config.log_file);
    config.validate();

    ProfileSet profiles = load_profile_set(config);
    auto reader = make_metadata_reader(config.metadata_reader);
    auto identifier = CameraIdentifier::from_profiles(profiles, config.metadata_samples,
                                                      config.confidence_threshold);
    Identification id = identifier.identify(cli.args[0], *reader);

    std::cout << id.profile->name << " (confidence " << id.confidence.score << ")\n";
    for (const auto& pattern : id.confidence.matched_patterns) {
        std::cout << "  matched " << pattern << "\n";
    }
    std::cout << "  day-folder " << id.profile->day_folder(today_stamp()).string() << "\n";
    return EXIT_OK;
}

static int cmd_verify(const CliOptions& cli) {
    if (cli.args.size() < 3) {
        std::cerr << "Usage: offload verify <source> <day_folder> <profile>\n";
        return EXIT_USAGE;
    }

    Config config = load_config(cli);
    Logger::getInstance().init(config.verbose, config.log_file);
    config.validate();

    ProfileSet profiles = load_profile_set(config);
    const std::string& name = cli.args[2];
    std::shared_ptr<const CameraProfile> profile;
    for (const auto& p : profiles) {
        if (p->name == name) {
            profile = p;
            break;
        }
    }
    if (!profile) {
        std::cerr << "Unknown profile: " << name << "\n";
        return EXIT_USAGE;
    }

    VerificationReport report =
        verify_transfer(cli.args[0], cli.args[1], *profile, config.digest_workers);
    std::cout << verification_to_json(report) << "\n";
    return report.passed ? EXIT_OK : EXIT_VERIFICATION;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        if (cli.command.empty()) {
            print_help();
            return EXIT_OK;
        }

        // Map command string to enum for switch statement
        enum class Command { RUN, IDENTIFY, VERIFY, PROFILES, CONFIG, UNKNOWN };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd == "run")
                return Command::RUN;
            if (cmd == "identify")
                return Command::IDENTIFY;
            if (cmd == "verify")
                return Command::VERIFY;
            if (cmd == "profiles")
                return Command::PROFILES;
            if (cmd == "config")
                return Command::CONFIG;
            return Command::UNKNOWN;
        };

        switch (get_command(cli.command)) {
        case Command::RUN:
            return cmd_run(cli);
        case Command::IDENTIFY:
            return cmd_identify(cli);
        case Command::VERIFY:
            return cmd_verify(cli);
        case Command::PROFILES: {
            Config config = load_config(cli);
            Logger::getInstance().init(config.verbose, fs::path());
            print_profiles(load_profile_set(config));
            return EXIT_OK;
        }
        case Command::CONFIG: {
            if (cli.args.empty()) {
                std::cerr << "Usage: offload config <gen|show>\n";
                return EXIT_USAGE;
            }
            const std::string& subcmd = cli.args[0];

            if (subcmd == "gen") {
                std::string output = cli.output.empty() ? CONFIG_FILENAME : cli.output;
                if (!Config::make_default().save_to_file(output)) {
                    std::cerr << "Cannot write " << output << "\n";
                    return EXIT_CONFIG;
                }
                std::cout << "Generated config: " << output << "\n";
                return EXIT_OK;
            } else if (subcmd == "show") {
                print_config(load_config(cli));
                return EXIT_OK;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            return EXIT_USAGE;
        }
        case Command::UNKNOWN:
            break;
        }

        std::cerr << "Unknown command: " << cli.command << "\n";
        print_help();
        return EXIT_USAGE;
    } catch (const OffloadError& e) {
        std::cerr << "Error (" << error_kind_to_string(e.kind()) << "): " << e.what() << "\n";
        if (!e.detail().empty()) {
            std::cerr << e.detail() << "\n";
        }
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        return EXIT_INTERNAL;
    }
}
