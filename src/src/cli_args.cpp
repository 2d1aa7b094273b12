#include <ort/cli_args.h>
#include <ort/cli_utils.h>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <vector>

namespace ort {

namespace {
    bool has_json_extension(const std::string& path) {
        return std::filesystem::path(path).extension() == ".json";
    }
}  // namespace

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    static const std::vector<std::string> valid_options = {
        "--to-json", "--from-json", "--check", "--stdout", "--output-dir", "-o", "--verbose", "-v", "--help", "-h"};

    std::optional<Action> requested;
    auto request = [&](Action a, const std::string& flag) {
        if (requested and *requested != a)
            throw std::invalid_argument(flag + " conflicts with an earlier mode option");
        requested = a;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" or arg == "-h") {
            action_ = Action::HELP;
            return;
        } else if (arg == "--to-json") {
            request(Action::TO_JSON, arg);
        } else if (arg == "--from-json") {
            request(Action::FROM_JSON, arg);
        } else if (arg == "--check") {
            request(Action::CHECK, arg);
        } else if (arg == "--stdout") {
            toStdout_ = true;
        } else if (arg == "--verbose" or arg == "-v") {
            verbose_ = true;
        } else if (arg == "--output-dir" or arg == "-o") {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a directory argument");
            outputDir_ = argv[++i];
        } else if (not arg.empty() and arg[0] == '-' and arg != "-") {
            throw std::invalid_argument(cli_utils::unknown_argument_message(arg, valid_options));
        } else if (filePath_.empty()) {
            filePath_ = arg;
        } else {
            throw std::invalid_argument("Unexpected extra argument: " + arg);
        }
    }

    if (filePath_.empty()) throw std::invalid_argument("missing input file");
    if (requested)
        action_ = *requested;
    else
        action_ = has_json_extension(filePath_) ? Action::FROM_JSON : Action::TO_JSON;
}

std::string CliArgs::outputPath() const {
    namespace fs = std::filesystem;
    fs::path in(filePath_);
    fs::path name = in.stem();
    name += (action_ == Action::FROM_JSON) ? ".ort" : ".json";
    if (not outputDir_.empty()) return (fs::path(outputDir_) / name).string();
    return (in.parent_path() / name).string();
}

std::string CliArgs::usage() {
    return "usage:\n"
           "  ort <file> [--to-json|--from-json|--check] [--stdout] [-o <dir>] [-v]\n"
           "\n"
           "  --to-json         convert ORT to JSON (default unless <file> ends in .json)\n"
           "  --from-json       convert JSON to ORT (default for .json input)\n"
           "  --check           parse ORT and print a short summary\n"
           "  --stdout          print the converted text instead of writing a file\n"
           "  -o, --output-dir  directory for the converted file (default: beside the input)\n"
           "  -v, --verbose     report parser progress on stderr\n"
           "  -h, --help        show this message\n";
}

}  // namespace ort
