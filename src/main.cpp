#include "CommandLineParser.hpp"
#include "CommandExecutor.hpp"
#include <iostream>

using namespace settlement;

int main(int argc, char** argv)
{
    try {
        CommandLineParser parser;
        auto parseResult = parser.parse(argc, argv);

        if (!parseResult) {
            std::cerr << "Parse error: " << parseResult.error() << std::endl;
            return 1;
        }

        CommandExecutor executor;
        auto execResult = executor.execute(parseResult.value());

        if (!execResult) {
            std::cerr << "Error: " << execResult.error() << std::endl;
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
}
