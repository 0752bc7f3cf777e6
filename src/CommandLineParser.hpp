#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>
#include <expected>

namespace po = boost::program_options;

namespace settlement {

struct ParsedCommand {
    std::string command;
    std::string subcommand;
    po::variables_map options;
    std::vector<std::string> positional;
};

class CommandLineParser {
public:
    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    po::options_description createCalculateOptions();
    po::options_description createSingleOptions();
    po::options_description createSettlementOptions();
};

}  // namespace settlement
