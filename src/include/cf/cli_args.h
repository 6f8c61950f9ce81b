#pragma once

#include <cf/options.h>
#include <string>

namespace cf {

// Parses command-line arguments for the confetti tool
class CliArgs {
  public:
    enum class Action {
        HELP,    // Show help message
        CHECK,   // Parse and report a summary (default)
        FORMAT,  // Re-emit the file in canonical form
        TOKENS   // Dump the token stream
    };

    CliArgs(int argc, const char* argv[]);

    // Accessors
    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    const std::string& getOutputPath() const { return outputPath_; }
    bool hasOutputPath() const { return !outputPath_.empty(); }
    bool isVerbose() const { return verbose_; }
    const ParserOptions& getParserOptions() const { return mapperOptions_.parser; }
    const MapperOptions& getMapperOptions() const { return mapperOptions_; }

  private:
    Action action_ = Action::HELP;
    std::string filePath_;
    std::string outputPath_;
    bool verbose_ = false;
    MapperOptions mapperOptions_;
};

}  // namespace cf
