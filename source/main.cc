// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "commands.hh"
#include "config.hh"
#include "log.hh"
#include "scaffold.hh"
#include "string_util.hh"

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {
    using modsync::exitSuccess;
    using modsync::exitUsage;

    struct CommandLine {
        fs::path root = ".";
        fs::path config;
        std::vector<std::string> ecosystems;
        std::vector<std::string> parameters;
        bool check = false;

        enum class Mode {
            None,
            Discover,
            Sync,
            Validate,
            Scaffold,
            Help,
        } mode = Mode::None;
    };

    bool parse_command(std::string_view arg, CommandLine& cmd) {
        if (arg == "discover")
            cmd.mode = CommandLine::Mode::Discover;
        else if (arg == "sync")
            cmd.mode = CommandLine::Mode::Sync;
        else if (arg == "validate")
            cmd.mode = CommandLine::Mode::Validate;
        else if (arg == "scaffold")
            cmd.mode = CommandLine::Mode::Scaffold;
        else
            return false;
        return true;
    }

    bool parse_arguments(int argc, char* argv[], CommandLine& cmd) {
        enum class Arg {
            None,
            Root,
            ConfigFile,
            Ecosystem,
        } mode = Arg::None;
        std::string_view mode_argument;

        bool allow_options = true;
        bool help = false;

        for (int arg_index = 1; arg_index != argc; ++arg_index) {
            auto arg = std::string_view{ argv[arg_index] };
            auto const original_arg = arg;

            switch (mode) {
            case Arg::Root:
                cmd.root = arg;
                mode = Arg::None;
                break;
            case Arg::ConfigFile:
                cmd.config = arg;
                mode = Arg::None;
                break;
            case Arg::Ecosystem:
                cmd.ecosystems.emplace_back(arg);
                mode = Arg::None;
                break;
            default:
                if (arg == "--") {
                    allow_options = false;
                    break;
                }
                else if (allow_options && modsync::starts_with(arg, "--"))
                    arg = arg.substr(2);
                else if (allow_options && modsync::starts_with(arg, "-") && arg.size() > 1)
                    arg = arg.substr(1);
                else if (cmd.mode == CommandLine::Mode::None) {
                    if (!parse_command(arg, cmd)) {
                        std::cerr << "error: Unknown command '" << arg << "'; use --help to see commands\n";
                        return false;
                    }
                    break;
                }
                else {
                    cmd.parameters.emplace_back(arg);
                    break;
                }

                mode_argument = original_arg;
                if (arg == "r" || arg == "root")
                    mode = Arg::Root;
                else if (arg == "c" || arg == "config")
                    mode = Arg::ConfigFile;
                else if (arg == "e" || arg == "ecosystem")
                    mode = Arg::Ecosystem;
                else if (arg == "check")
                    cmd.check = true;
                else if (arg == "h" || arg == "help")
                    help = true;
                else {
                    std::cerr << "error: Unknown command argument '" << original_arg << "'\n";
                    return false;
                }

                break;
            }
        }

        if (mode != Arg::None) {
            std::cerr << "error: Expected parameter after '" << mode_argument << "'\n";
            return false;
        }

        if (help) {
            cmd.mode = CommandLine::Mode::Help;
            return true;
        }

        if (cmd.mode == CommandLine::Mode::None) {
            std::cerr << "error: No command provided; use --help to see commands\n";
            return false;
        }

        if (cmd.check && cmd.mode != CommandLine::Mode::Sync) {
            std::cerr << "error: --check is only valid with the sync command\n";
            return false;
        }

        size_t const maxParameters = cmd.mode == CommandLine::Mode::Scaffold ? 4 : 0;
        if (cmd.parameters.size() > maxParameters) {
            std::cerr << "error: Unexpected command parameter '" << cmd.parameters[maxParameters] << "'\n";
            return false;
        }

        if (cmd.mode == CommandLine::Mode::Scaffold && cmd.parameters.empty()) {
            std::cerr << "error: scaffold requires a module name\n";
            return false;
        }

        return true;
    }
}

static int help(std::filesystem::path program) {
    std::cout <<
        "usage: " << program.filename().string() << " [options] <command> [<parameters>]\n" <<
        "commands:\n" <<
        "  discover                          List the schema modules\n" <<
        "  sync [--check]                    Update every workspace manifest; --check only reports drift\n" <<
        "  validate                          Check the client directories against the schema modules\n" <<
        "  scaffold <name> [<description>] [<version>] [<entity>]\n" <<
        "                                    Create a new schema module from the template set\n" <<
        "options:\n" <<
        "  -r|--root <dir>         Repository root, defaults to the current directory\n" <<
        "  -c|--config <file>      JSON configuration file, defaults to modsync.json in the root if present\n" <<
        "  -e|--ecosystem <name>   Restrict to the named ecosystem; may be repeated\n" <<
        "  -h|--help               Print this help information\n";
    return exitSuccess;
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parse_arguments(argc, argv, cmd)) {
        return exitUsage;
    }

    if (cmd.mode == CommandLine::Mode::Help)
        return help(argv[0]);

    modsync::Log log;
    modsync::Config config;
    if (!modsync::loadConfiguration(cmd.root, cmd.config, cmd.ecosystems, config, log)) {
        log.flush(std::cerr);
        return exitUsage;
    }

    int result = exitUsage;
    switch (cmd.mode) {
    case CommandLine::Mode::Discover: result = modsync::runDiscover(config, std::cout, log); break;
    case CommandLine::Mode::Sync: result = modsync::runSync(config, cmd.check, std::cout, log); break;
    case CommandLine::Mode::Validate: result = modsync::runValidate(config, std::cout, log); break;
    case CommandLine::Mode::Scaffold: {
        modsync::ScaffoldRequest request;
        request.name = cmd.parameters[0];
        if (cmd.parameters.size() > 1)
            request.description = cmd.parameters[1];
        if (cmd.parameters.size() > 2)
            request.version = cmd.parameters[2];
        if (cmd.parameters.size() > 3)
            request.entity = cmd.parameters[3];
        result = modsync::runScaffold(config, std::move(request), std::cout, log);
        break;
    }
    default: break;
    }

    log.flush(std::cerr);
    return result;
}
