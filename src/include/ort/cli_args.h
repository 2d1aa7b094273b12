#pragma once

#include <string>

namespace ort {

// Command line of the `ort` converter:
//   ort <file> [--to-json|--from-json|--check] [--stdout] [-o <dir>] [-v]
class CliArgs {
  public:
    enum class Action {
        HELP,       // print usage
        TO_JSON,    // ORT in, JSON out (default for anything but .json)
        FROM_JSON,  // JSON in, ORT out (default for .json input)
        CHECK       // parse ORT and report
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    const std::string& getOutputDir() const { return outputDir_; }
    bool toStdout() const { return toStdout_; }
    bool verbose() const { return verbose_; }

    // Where a conversion is written: the input's stem with the target
    // extension, beside the input or under the output directory.
    std::string outputPath() const;

    static std::string usage();

  private:
    Action action_ = Action::HELP;
    std::string filePath_;
    std::string outputDir_;
    bool toStdout_ = false;
    bool verbose_ = false;
};

}  // namespace ort
