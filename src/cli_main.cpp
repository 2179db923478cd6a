#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "ndiff/Commands.hpp"
#include "ndiff/DiffNode.hpp"
#include "ndiff/Errors.hpp"
#include "ndiff/Loader.hpp"
#include "ndiff/Options.hpp"

using namespace ndiff;

namespace {

bool g_verbose = false;

void note(const std::string& msg) {
    if (g_verbose) std::cerr << "ndiff: " << msg << "\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("ndiff", "Recursive diff and patch for nested JSON/TOML data");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("ops", "Differ options, e.g. 'U=0,O=0,trimR' (keys: A N O R U trimR)",
                cxxopts::value<std::string>()->default_value(""))
            ("options", "JSON/TOML file with differ options", cxxopts::value<std::string>())
            ("o,out", "Write output to FILE instead of stdout", cxxopts::value<std::string>())
            ("ofmt", "Output format: auto|json|toml", cxxopts::value<std::string>()->default_value("auto"))
            ("stat", "diff: print op counts instead of the diff")
            ("q,quiet", "diff: print nothing, report via exit status")
            ("v,verbose", "Report progress on stderr")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: diff OLD NEW | patch TARGET PATCH\n";
            return result.count("help") ? exit_code::kSame : exit_code::kError;
        }

        g_verbose = result.count("verbose") > 0;
        std::string out = result.count("out") ? result["out"].as<std::string>() : std::string();
        std::string ofmt = result["ofmt"].as<std::string>();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() != want) {
                std::cerr << "Error: command '" << cmd << "' takes " << (want - 1) << " arguments\n";
                return false;
            }
            return true;
        };

        // DIFF
        if (cmd == "diff") {
            if (!expect_args(3)) return exit_code::kError;

            DiffOptions opts;
            if (result.count("options")) {
                opts.update(load_file(result["options"].as<std::string>()));
            }
            opts = parse_option_list(result["ops"].as<std::string>(), opts);
            note("options " + opts.to_value().dump());
            if (!opts.is_patchable()) {
                note("A, N or R disabled: diff can't be used to patch");
            }

            FileDiff fd = diff_files(cmdv[1], cmdv[2], opts);
            const DiffStats& stats = fd.stats;
            note("added " + std::to_string(stats.added) +
                 ", removed " + std::to_string(stats.removed) +
                 ", changed " + std::to_string(stats.changed) +
                 ", unchanged " + std::to_string(stats.unchanged));

            if (result.count("quiet")) return fd.status;

            if (result.count("stat")) {
                std::cout << "added: " << stats.added << "\n"
                          << "removed: " << stats.removed << "\n"
                          << "changed: " << stats.changed << "\n"
                          << "unchanged: " << stats.unchanged << "\n";
                return fd.status;
            }

            Format fmt = resolve_output_format(ofmt, out);
            if (out.empty()) {
                std::cout << dump_value(fd.node, fmt) << "\n";
            } else {
                write_file(out, fd.node, fmt);
                note("wrote " + format_name(fmt) + " to " + out);
            }
            return fd.status;
        }

        // PATCH (writes back to TARGET unless --out is given)
        if (cmd == "patch") {
            if (!expect_args(3)) return exit_code::kError;

            std::string dest = patch_file(cmdv[1], cmdv[2], out, ofmt);
            note("patched " + cmdv[1] + " with " + cmdv[2] + ", wrote " + dest);
            return exit_code::kSame;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return exit_code::kError;

    } catch (const TargetMismatch& tm) {
        std::cerr << "Error: " << tm.what() << "\n"
                  << "(the patch does not fit this target; nothing was written)\n";
        return exit_code::kError;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return exit_code::kError;
    }
}
