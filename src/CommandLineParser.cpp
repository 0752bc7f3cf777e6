#include "CommandLineParser.hpp"
#include <sstream>

namespace settlement {

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'settlement help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Глобальный help: "help <cmd>", "<cmd> --help", "<cmd> -h"
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "help" || arg == "--help" || arg == "-h") {
                if (i == 1) {
                    for (int j = 2; j < argc; ++j) {
                        if (argv[j][0] != '-') {
                            result.positional.push_back(argv[j]);
                        }
                    }
                } else {
                    result.positional.push_back(result.command);
                }
                result.command = "help";
                return result;
            }
        }

        int startIdx = 2;
        if (result.command == "settlement" && argc > 2 && argv[2][0] != '-') {
            result.subcommand = argv[2];
            startIdx = 3;
        }

        std::vector<std::string> args(argv + startIdx, argv + argc);

        if (result.command == "calculate") {
            auto desc = createCalculateOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "single") {
            auto desc = createSingleOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "settlement") {
            auto desc = createSettlementOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "version") {
            result.positional = args;

        } else {
            std::ostringstream oss;
            oss << "Unknown command: " << result.command;
            return std::unexpected(oss.str());
        }

        return result;

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") +
                               e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Calculate Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createCalculateOptions() {
    po::options_description desc("Calculate options");
    desc.add_options()
        ("settlement,s", po::value<std::string>()->required(),
         "Settlement type (TWITTER, KRAFT_HEINZ)")

        ("file,f", po::value<std::string>()->required(),
         "Transactions CSV file")

        ("format", po::value<std::string>()->default_value("text"),
         "Output format: text, json, csv")

        ("output,o", po::value<std::string>(),
         "Write report to file instead of stdout")

        ("delimiter", po::value<char>()->default_value(','),
         "CSV field delimiter")

        ("detailed", po::bool_switch()->default_value(false),
         "Include individual matches in the report")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Single Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createSingleOptions() {
    po::options_description desc("Single transaction options");
    desc.add_options()
        ("settlement,s", po::value<std::string>()->required(),
         "Settlement type (TWITTER, KRAFT_HEINZ)")

        ("purchase-date", po::value<std::string>(),
         "Purchase date (YYYY-MM-DD[ HH:MM[:SS]])")

        ("purchase-price", po::value<double>(),
         "Purchase price per share")

        ("sale-date", po::value<std::string>(),
         "Sale date (omit for held shares)")

        ("sale-price", po::value<double>(),
         "Sale price per share")

        ("quantity,q", po::value<double>()->default_value(1.0),
         "Number of shares")

        ("beginning-holdings", po::bool_switch()->default_value(false),
         "Shares held at the start of the class period")

        ("format", po::value<std::string>()->default_value("text"),
         "Output format: text, json")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Settlement Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createSettlementOptions() {
    po::options_description desc("Settlement options");
    desc.add_options()
        ("settlement,s", po::value<std::string>(),
         "Settlement type (TWITTER, KRAFT_HEINZ)")

        ("help,h", "Show help message");

    return desc;
}

}  // namespace settlement
