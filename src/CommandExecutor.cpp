#include "CommandExecutor.hpp"
#include "SettlementCalculator.hpp"
#include "DateUtils.hpp"
#include <iostream>
#include <sstream>

namespace settlement {

CommandExecutor::CommandExecutor(std::shared_ptr<IFileReader> reader)
    : reader_(reader ? reader : std::make_shared<FileReader>())
{
}

std::expected<void, std::string> CommandExecutor::execute(const ParsedCommand& cmd)
{
    // Маршрутизация команд
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "version") {
        return executeVersion(cmd);
    } else if (cmd.command == "calculate") {
        return executeCalculate(cmd);
    } else if (cmd.command == "single") {
        return executeSingle(cmd);
    } else if (cmd.command == "settlement") {
        return executeSettlement(cmd);
    } else {
        return std::unexpected("Unknown command: " + cmd.command);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    if (!cmd.positional.empty()) {
        printHelp(cmd.positional[0]);
    } else {
        printHelp();
    }
    return {};
}

std::expected<void, std::string> CommandExecutor::executeVersion(const ParsedCommand& /*cmd*/)
{
    printVersion();
    return {};
}

void CommandExecutor::printHelp(std::string_view topic)
{
    CommandLineParser parser;

    if (topic.empty()) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "Settlement Recognized Loss Calculator" << std::endl;
        std::cout << "Usage: settlement <command> [options]" << std::endl << std::endl;

        std::cout << "COMMANDS:" << std::endl;
        std::cout << "  calculate               Calculate losses for a transactions file" << std::endl;
        std::cout << "  single                  Evaluate one purchase/sale pair" << std::endl;
        std::cout << "  settlement              Show settlement parameters" << std::endl;
        std::cout << "  help <command>          Show detailed help for a command" << std::endl;
        std::cout << "  version                 Show version information" << std::endl;
        std::cout << std::endl;

        std::cout << "Examples:" << std::endl;
        std::cout << "  settlement calculate -s TWITTER -f trades.csv --format json" << std::endl;
        std::cout << "  settlement single -s KRAFT_HEINZ --purchase-date 2016-01-15 "
                     "--purchase-price 50" << std::endl;
        std::cout << "  settlement settlement show -s TWITTER" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "calculate") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: calculate" << std::endl;
        std::cout << "Match sales to purchases (FIFO) and compute recognized loss" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "USAGE:" << std::endl;
        std::cout << "  settlement calculate -s TYPE -f FILE [OPTIONS]" << std::endl << std::endl;

        std::cout << "CSV COLUMNS:" << std::endl;
        std::cout << "  date, type (purchase|sale|beginning), quantity, price," << std::endl;
        std::cout << "  entity, fund_name, security_id, comment, id" << std::endl << std::endl;

        std::cout << parser.createCalculateOptions() << std::endl;

    } else if (topic == "single") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: single" << std::endl;
        std::cout << "Evaluate recognized loss for one purchase and optional sale" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "USAGE:" << std::endl;
        std::cout << "  settlement single -s TYPE --purchase-date DATE --purchase-price PRICE"
                  << std::endl;
        std::cout << "                    [--sale-date DATE --sale-price PRICE] [--quantity N]"
                  << std::endl << std::endl;

        std::cout << parser.createSingleOptions() << std::endl;

    } else if (topic == "settlement") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: settlement" << std::endl;
        std::cout << "Inspect built-in settlement configurations" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "SUBCOMMANDS:" << std::endl;
        std::cout << "  list                    List supported settlements" << std::endl;
        std::cout << "  show -s TYPE            Show periods and loss tables" << std::endl;
        std::cout << std::endl;

        std::cout << parser.createSettlementOptions() << std::endl;

    } else {
        std::cout << "Unknown help topic: " << topic << std::endl;
        printHelp();
    }
}

void CommandExecutor::printVersion() const
{
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << "Settlement Recognized Loss Calculator" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl;
    std::cout << "Build Date: " << __DATE__ << std::endl;
    std::cout << std::string(50, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Calculate
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeCalculate(const ParsedCommand& cmd)
{
    auto selectorResult = getRequiredOption<std::string>(cmd, "settlement");
    if (!selectorResult) {
        return std::unexpected(selectorResult.error());
    }

    auto fileResult = getRequiredOption<std::string>(cmd, "file");
    if (!fileResult) {
        return std::unexpected(fileResult.error());
    }

    auto formatResult = getRequiredOption<std::string>(cmd, "format");
    if (!formatResult) {
        return std::unexpected(formatResult.error());
    }

    const auto& format = *formatResult;
    if (format != "text" && format != "json" && format != "csv") {
        return std::unexpected("Unsupported format: " + format + ". Use text, json or csv");
    }

    bool detailed = cmd.options.count("detailed") && cmd.options.at("detailed").as<bool>();
    char delimiter = cmd.options.count("delimiter") ? cmd.options.at("delimiter").as<char>() : ',';

    auto calculatorResult = SettlementCalculator::create(*selectorResult);
    if (!calculatorResult) {
        return std::unexpected(calculatorResult.error());
    }

    const auto& calculator = *calculatorResult;

    // ════════════════════════════════════════════════════════════════════════
    // Загрузка сделок
    // ════════════════════════════════════════════════════════════════════════

    TransactionCsvSource source(reader_, delimiter);
    auto loadResult = source.load(*fileResult, calculator->configuration());
    if (!loadResult) {
        return std::unexpected(loadResult.error());
    }

    auto result = calculator->calculate(loadResult->transactions);
    if (!result.success) {
        return std::unexpected(result.message);
    }

    // ════════════════════════════════════════════════════════════════════════
    // Вывод
    // ════════════════════════════════════════════════════════════════════════

    if (format == "json") {
        auto report = writer_.reportToJson(result, detailed);
        report["transactions_loaded"] = loadResult->transactions.size();
        report["total_rows"] = loadResult->totalRows;
        report["load_errors"] = loadResult->errors;
        return emit(cmd, report.dump(2) + "\n");
    }

    if (format == "csv") {
        return emit(cmd, writer_.matchesToCsv(result.matches));
    }

    std::ostringstream text;
    writer_.printReport(text, result, detailed);
    return emit(cmd, text.str());
}

// ═════════════════════════════════════════════════════════════════════════════
// Single
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeSingle(const ParsedCommand& cmd)
{
    auto selectorResult = getRequiredOption<std::string>(cmd, "settlement");
    if (!selectorResult) {
        return std::unexpected(selectorResult.error());
    }

    auto calculatorResult = SettlementCalculator::create(*selectorResult);
    if (!calculatorResult) {
        return std::unexpected(calculatorResult.error());
    }

    const auto& calculator = *calculatorResult;
    bool beginningHoldings = cmd.options.count("beginning-holdings") &&
                             cmd.options.at("beginning-holdings").as<bool>();

    // Остатки на начало: дата и цена покупки не требуются
    TimePoint purchaseDate = calculator->configuration().classStart();
    double purchasePrice = 0.0;

    if (!beginningHoldings) {
        auto dateStr = getRequiredOption<std::string>(cmd, "purchase-date");
        if (!dateStr) {
            return std::unexpected(dateStr.error());
        }

        auto dateResult = parseDateString(*dateStr);
        if (!dateResult) {
            return std::unexpected(dateResult.error());
        }
        purchaseDate = *dateResult;

        auto priceResult = getRequiredOption<double>(cmd, "purchase-price");
        if (!priceResult) {
            return std::unexpected(priceResult.error());
        }
        purchasePrice = *priceResult;

        if (purchasePrice < 0.0) {
            return std::unexpected("Purchase price cannot be negative");
        }
    }

    bool hasSaleDate = cmd.options.count("sale-date") > 0;
    bool hasSalePrice = cmd.options.count("sale-price") > 0;

    if (hasSaleDate != hasSalePrice) {
        return std::unexpected("Both --sale-date and --sale-price are required for a sale");
    }

    std::optional<SaleEvent> sale;
    if (hasSaleDate) {
        auto saleDate = parseDateString(cmd.options.at("sale-date").as<std::string>());
        if (!saleDate) {
            return std::unexpected(saleDate.error());
        }

        double salePrice = cmd.options.at("sale-price").as<double>();
        if (salePrice < 0.0) {
            return std::unexpected("Sale price cannot be negative");
        }

        sale = SaleEvent{*saleDate, salePrice};
    }

    auto quantityResult = getRequiredOption<double>(cmd, "quantity");
    if (!quantityResult) {
        return std::unexpected(quantityResult.error());
    }

    if (*quantityResult <= 0.0) {
        return std::unexpected("Quantity must be positive");
    }

    auto single = calculator->evaluateSingle(
        purchaseDate, purchasePrice, sale, *quantityResult, beginningHoldings);

    auto formatResult = getRequiredOption<std::string>(cmd, "format");
    if (formatResult && *formatResult == "json") {
        std::cout << writer_.singleToJson(single).dump(2) << std::endl;
    } else {
        writer_.printSingle(std::cout, single);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Settlement info
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeSettlement(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty() || cmd.subcommand == "list") {
        return executeSettlementList(cmd);
    } else if (cmd.subcommand == "show") {
        return executeSettlementShow(cmd);
    } else {
        return std::unexpected("Unknown settlement subcommand: " + cmd.subcommand);
    }
}

std::expected<void, std::string> CommandExecutor::executeSettlementShow(const ParsedCommand& cmd)
{
    auto selectorResult = getRequiredOption<std::string>(cmd, "settlement");
    if (!selectorResult) {
        return std::unexpected(selectorResult.error());
    }

    auto configResult = SettlementConfiguration::create(*selectorResult);
    if (!configResult) {
        return std::unexpected(configResult.error());
    }

    writer_.printConfiguration(std::cout, **configResult);
    return {};
}

std::expected<void, std::string> CommandExecutor::executeSettlementList(
    const ParsedCommand& /*cmd*/)
{
    std::cout << "Supported settlements:" << std::endl;

    for (auto type : {SettlementType::Twitter, SettlementType::KraftHeinz}) {
        auto configResult = SettlementConfiguration::create(type);
        if (!configResult) {
            return std::unexpected(configResult.error());
        }

        const auto& config = **configResult;
        std::cout << "  " << toString(type) << "  (" << toString(config.method()) << ", "
                  << formatDate(config.classStart()) << " - "
                  << formatDate(config.classEnd()) << ")" << std::endl;
    }

    return {};
}

std::expected<void, std::string> CommandExecutor::emit(
    const ParsedCommand& cmd, const std::string& content)
{
    if (cmd.options.count("output")) {
        auto path = cmd.options.at("output").as<std::string>();
        auto writeResult = writer_.writeFile(path, content);
        if (!writeResult) {
            return std::unexpected(writeResult.error());
        }
        std::cout << "✓ Report written to " << path << std::endl;
        return {};
    }

    std::cout << content;
    return {};
}

}  // namespace settlement
