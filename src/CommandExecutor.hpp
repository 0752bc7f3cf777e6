#pragma once

#include "CommandLineParser.hpp"
#include "TransactionCsvSource.hpp"
#include "ReportWriter.hpp"
#include <memory>
#include <expected>
#include <string>
#include <string_view>

namespace settlement {

class CommandExecutor {
public:
    explicit CommandExecutor(std::shared_ptr<IFileReader> reader = nullptr);

    std::expected<void, std::string> execute(const ParsedCommand& cmd);

private:
    std::shared_ptr<IFileReader> reader_;
    ReportWriter writer_;

    // Help & Version
    std::expected<void, std::string> executeHelp(const ParsedCommand& cmd);
    std::expected<void, std::string> executeVersion(const ParsedCommand& cmd);

    void printHelp(std::string_view topic = "");
    void printVersion() const;

    // Calculation
    std::expected<void, std::string> executeCalculate(const ParsedCommand& cmd);
    std::expected<void, std::string> executeSingle(const ParsedCommand& cmd);

    // Settlement info
    std::expected<void, std::string> executeSettlement(const ParsedCommand& cmd);
    std::expected<void, std::string> executeSettlementShow(const ParsedCommand& cmd);
    std::expected<void, std::string> executeSettlementList(const ParsedCommand& cmd);

    // Вывод в файл (--output) или в stdout
    std::expected<void, std::string> emit(
        const ParsedCommand& cmd, const std::string& content);

    // Utility methods
    template<typename T>
    std::expected<T, std::string> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;
};

// Template implementation
template<typename T>
std::expected<T, std::string> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const {

    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::unexpected(
            "Required option '" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const std::exception& e) {
        return std::unexpected(
            "Invalid value for option '" + optName + "': " + e.what());
    }
}

}  // namespace settlement
