#include <cuedat/version.hpp>

#include "commands.hpp"
#include "settings.hpp"

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <exception>
#include <string>
#include <system_error>
#include <vector>

int main(int argc, char *argv[]) {
    bool showHelp = false;
    bool showVersion = false;
    std::string command{};
    app::CommandOptions cmdOptions{};
    std::string outputDir = ".";
    std::string datPath{};
    std::string referenceCue{};
    std::string cueSheetsDir{};
    std::string configPath = "cuedat.toml";

    cxxopts::Options options("cuedat",
                             "CUE/BIN track geometry and DAT verification tool\nVersion " CueDat_FULL_VERSION);
    options.add_options()("h,help", "Display this help text.", cxxopts::value(showHelp)->default_value("false"));
    options.add_options()("v,version", "Display the version.", cxxopts::value(showVersion)->default_value("false"));
    options.add_options()("c,config", "Settings file. Missing files leave every setting at its default.",
                          cxxopts::value(configPath)->default_value("cuedat.toml"), "path");
    options.add_options()("o,output-dir", "Directory where merge and split write their results.",
                          cxxopts::value(outputDir)->default_value("."), "path");
    options.add_options()("n,name", "Base name of the merged or split image. Defaults to the input cue sheet's name.",
                          cxxopts::value(cmdOptions.basename), "name");
    options.add_options()("cue-only", "Only write the cue sheet, not the track data.",
                          cxxopts::value(cmdOptions.cueOnly)->default_value("false"));
    options.add_options()("d,dat", "DAT file to identify or verify against.", cxxopts::value(datPath), "path");
    options.add_options()("r,reference-cue", "Original cue sheet to compare the dump's cue sheet with.",
                          cxxopts::value(referenceCue), "path");
    options.add_options()("s,cue-sheets",
                          "Directory of original cue sheets, looked up by game name. Overrides --reference-cue.",
                          cxxopts::value(cueSheetsDir), "path");

    options.add_options()("command", "Command: merge, split, identify, verify", cxxopts::value(command));
    options.add_options()("inputs", "Inputs", cxxopts::value(cmdOptions.inputs));

    options.parse_positional({"command", "inputs"});
    options.positional_help("<command> <inputs...>");

    auto printHelp = [&] {
        fmt::println("{}", options.help());
        fmt::println("  <command> is one of:");
        fmt::println("    merge     Merge the track files of each cue sheet into a single image");
        fmt::println("    split     Split the single-file image of each cue sheet into one file per track");
        fmt::println("    identify  Identify each dump folder or file against a DAT (requires --dat)");
        fmt::println("    verify    Verify each dump folder is correct and complete (requires --dat)");
        fmt::println("");
        fmt::println("  Inputs are processed independently; a failed input does not stop the others.");
    };

    try {
        auto result = options.parse(argc, argv);

        if (showHelp) {
            printHelp();
            return 0;
        }
        if (showVersion) {
            fmt::println("cuedat {}", cuedat::version::fullstring);
            return 0;
        }

        if (!result.contains("command")) {
            fmt::println("Missing argument: <command>");
            fmt::println("");
            printHelp();
            return 1;
        }
        if (cmdOptions.inputs.empty()) {
            fmt::println("Missing argument: <inputs>");
            fmt::println("");
            printHelp();
            return 1;
        }

        app::Settings settings{};
        if (auto loadResult = settings.Load(configPath); !loadResult) {
            fmt::println("Could not load settings from {}: {}", configPath, loadResult.string());
            return 1;
        }

        cmdOptions.outputDir = outputDir;
        cmdOptions.datPath = datPath;
        if (!referenceCue.empty()) {
            cmdOptions.referenceCue = referenceCue;
        }
        if (!cueSheetsDir.empty()) {
            cmdOptions.cueSheetsDir = cueSheetsDir;
        }

        if (command == "merge") {
            return app::RunMerge(cmdOptions, settings);
        } else if (command == "split") {
            return app::RunSplit(cmdOptions, settings);
        } else if (command == "identify") {
            return app::RunIdentify(cmdOptions, settings);
        } else if (command == "verify") {
            return app::RunVerify(cmdOptions, settings);
        } else {
            fmt::println("Invalid command: {}", command);
            fmt::println("");
            printHelp();
            return 1;
        }
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::println("Failed to parse arguments: {}", e.what());
        return -1;
    } catch (const std::system_error &e) {
        fmt::println("System error: {}", e.what());
        return e.code().value();
    } catch (const std::exception &e) {
        fmt::println("Unhandled exception: {}", e.what());
        return -1;
    }
}
