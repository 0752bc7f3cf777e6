#include "TransactionCsvSource.hpp"
#include "DateUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <fstream>
#include <iostream>

namespace settlement {

namespace {

std::string toLower(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool containsAny(const std::string& text, std::initializer_list<std::string_view> keywords)
{
    return std::any_of(keywords.begin(), keywords.end(),
        [&text](std::string_view keyword) { return text.find(keyword) != std::string::npos; });
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// FileReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<std::string>, std::string> FileReader::readLines(
    std::string_view filePath) {
    std::vector<std::string> lines;
    std::ifstream file{std::string(filePath)};

    if (!file.is_open()) {
        return std::unexpected(std::string("Failed to open file: ") + std::string(filePath));
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    if (lines.empty()) {
        return std::unexpected(std::string("File is empty: ") + std::string(filePath));
    }

    return lines;
}

// ═══════════════════════════════════════════════════════════════════════════════
// TransactionCsvSource Implementation
// ═══════════════════════════════════════════════════════════════════════════════

TransactionCsvSource::TransactionCsvSource(
    std::shared_ptr<IFileReader> reader,
    char delimiter)
    : reader_(reader ? reader : std::make_shared<FileReader>()),
      delimiter_(delimiter) {}

std::expected<LoadReport, std::string> TransactionCsvSource::load(
    std::string_view filePath,
    const SettlementConfiguration& configuration) const {

    auto linesResult = reader_->readLines(filePath);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    if (linesResult->empty()) {
        return std::unexpected("File has no header line");
    }

    auto report = parseLines(*linesResult, configuration);

    std::cerr << "Loaded " << report.transactions.size() << " transactions from "
              << filePath << " (" << report.errors.size() << " errors, "
              << report.skippedRows << " skipped)" << std::endl;

    for (const auto& error : report.errors) {
        std::cerr << "⚠ Warning: " << error << std::endl;
    }

    return report;
}

LoadReport TransactionCsvSource::parseLines(
    const std::vector<std::string>& lines,
    const SettlementConfiguration& configuration) const {

    LoadReport report;

    if (lines.empty()) {
        return report;
    }

    std::vector<std::string> headers;
    for (const auto& header : parseCSVLine(lines.front())) {
        headers.push_back(normalizeHeader(header));
    }

    for (std::size_t i = 1; i < lines.size(); ++i) {
        std::size_t rowNumber = i;
        report.totalRows++;

        auto fields = parseCSVLine(lines[i]);

        Row row;
        for (std::size_t col = 0; col < headers.size() && col < fields.size(); ++col) {
            row[headers[col]] = fields[col];
        }

        auto txnResult = parseRow(row, rowNumber, report.transactions.size(), configuration);
        if (!txnResult) {
            report.errors.push_back(
                "Row " + std::to_string(rowNumber) + ": " + txnResult.error());
            continue;
        }

        if (!txnResult->has_value()) {
            report.skippedRows++;
            continue;
        }

        report.transactions.push_back(std::move(**txnResult));
    }

    return report;
}

std::expected<std::optional<Transaction>, std::string> TransactionCsvSource::parseRow(
    const Row& row,
    std::size_t rowNumber,
    std::size_t loadedCount,
    const SettlementConfiguration& configuration) const {

    auto quantityFrom = [&row](std::initializer_list<std::string_view> aliases)
        -> std::expected<double, std::string> {
        auto value = lookup(row, aliases);
        if (!value) {
            return 0.0;
        }
        return parseNumber(*aliases.begin(), *value);
    };

    // ════════════════════════════════════════════════════════════════════════
    // 1. Тип операции и количество
    // ════════════════════════════════════════════════════════════════════════

    std::string typeStr = toLower(lookup(row, {"transaction_type", "type"}).value_or(""));

    TransactionType type = TransactionType::Purchase;
    std::expected<double, std::string> quantity = 0.0;

    if (containsAny(typeStr, {"beginning", "holding", "opening"})) {
        type = TransactionType::BeginningHoldings;
        quantity = quantityFrom({"holdings", "quantity", "shares", "qty"});
    } else if (containsAny(typeStr, {"purchase", "buy"})) {
        type = TransactionType::Purchase;
        quantity = quantityFrom({"purchases", "quantity", "shares", "qty"});
    } else if (containsAny(typeStr, {"sale", "sell"})) {
        type = TransactionType::Sale;
        quantity = quantityFrom({"sales", "quantity", "shares", "qty"});
    } else {
        // Тип не указан: определяем по колонкам purchases / sales / holdings
        auto purchases = quantityFrom({"purchases"});
        auto sales = quantityFrom({"sales"});
        auto holdings = quantityFrom({"holdings"});

        if (!purchases) return std::unexpected(purchases.error());
        if (!sales) return std::unexpected(sales.error());
        if (!holdings) return std::unexpected(holdings.error());

        if (*purchases > 0.0) {
            type = TransactionType::Purchase;
            quantity = *purchases;
        } else if (*sales > 0.0) {
            type = TransactionType::Sale;
            quantity = *sales;
        } else if (*holdings > 0.0) {
            type = TransactionType::BeginningHoldings;
            quantity = *holdings;
        } else {
            return std::optional<Transaction>{};
        }
    }

    if (!quantity) {
        return std::unexpected(quantity.error());
    }

    if (*quantity <= 0.0) {
        return std::optional<Transaction>{};
    }

    Transaction txn;
    txn.type = type;
    txn.quantity = *quantity;

    // ════════════════════════════════════════════════════════════════════════
    // 2. Дата и цена
    // ════════════════════════════════════════════════════════════════════════

    bool isSale = type == TransactionType::Sale;
    auto dateStr = isSale
        ? lookup(row, {"trade_date", "date", "transaction_date", "sale_date"})
        : lookup(row, {"trade_date", "date", "transaction_date", "purchase_date"});

    if (type == TransactionType::BeginningHoldings) {
        // Остатки на начало оцениваются по нулевой цене
        txn.price = 0.0;
        txn.date = addDays(configuration.classStart(), -1);

        if (dateStr) {
            auto dateResult = parseDateString(*dateStr);
            if (!dateResult) {
                return std::unexpected(dateResult.error());
            }
            txn.date = *dateResult;
        }
    } else {
        if (!dateStr) {
            return std::unexpected("Invalid date");
        }

        auto dateResult = parseDateString(*dateStr);
        if (!dateResult) {
            return std::unexpected(dateResult.error());
        }
        txn.date = *dateResult;

        auto priceStr = isSale
            ? lookup(row, {"price_per_share", "price", "sale_price"})
            : lookup(row, {"price_per_share", "price", "purchase_price"});

        if (!priceStr) {
            return std::unexpected("Missing price");
        }

        auto price = parseNumber("price", *priceStr);
        if (!price) {
            return std::unexpected(price.error());
        }

        if (*price < 0.0) {
            return std::unexpected("Price cannot be negative: " + *priceStr);
        }
        txn.price = *price;
    }

    // ════════════════════════════════════════════════════════════════════════
    // 3. Атрибуты
    // ════════════════════════════════════════════════════════════════════════

    auto entity = lookup(row, {"entity", "client"});
    auto fund = lookup(row, {"fund_name", "fund"});

    txn.entity = entity.value_or(fund.value_or("Unknown"));
    txn.fundName = fund.value_or(entity.value_or("Unknown"));
    txn.securityId = lookup(row, {"security_id", "ticker"}).value_or("");
    txn.comment = lookup(row, {"comment", "notes"}).value_or("");
    txn.id = lookup(row, {"id"}).value_or(
        "txn_" + std::to_string(rowNumber) + "_" + std::to_string(loadedCount));

    return std::optional<Transaction>{std::move(txn)};
}

std::vector<std::string> TransactionCsvSource::parseCSVLine(std::string_view line) const {

    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    auto flush = [&fields, &field]() {
        // Убираем пробелы с концов
        auto start = field.find_first_not_of(" \t\r\n");
        auto end = field.find_last_not_of(" \t\r\n");

        if (start != std::string::npos && end != std::string::npos) {
            fields.push_back(field.substr(start, end - start + 1));
        } else {
            fields.push_back("");
        }
        field.clear();
    };

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (inQuotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';   // "" внутри кавычек
                ++i;
            } else if (c == '"') {
                inQuotes = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == delimiter_) {
            flush();
        } else {
            field += c;
        }
    }

    if (!line.empty()) {
        flush();
    }

    return fields;
}

std::string TransactionCsvSource::normalizeHeader(std::string_view header) {
    std::string normalized = toLower(header);
    std::replace(normalized.begin(), normalized.end(), ' ', '_');
    return normalized;
}

std::optional<std::string> TransactionCsvSource::lookup(
    const Row& row, std::initializer_list<std::string_view> aliases) {

    for (auto alias : aliases) {
        auto it = row.find(std::string(alias));
        if (it != row.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::expected<double, std::string> TransactionCsvSource::parseNumber(
    std::string_view column, std::string_view valueStr) {

    try {
        std::size_t idx;
        double value = std::stod(std::string(valueStr), &idx);
        if (idx != valueStr.length()) {
            return std::unexpected(std::string("Invalid ") + std::string(column) +
                                   ": " + std::string(valueStr));
        }
        // stod принимает nan и inf
        if (!std::isfinite(value)) {
            return std::unexpected(std::string("Non-finite ") + std::string(column) +
                                   ": " + std::string(valueStr));
        }
        return value;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to parse ") + std::string(column) +
                               ": " + std::string(valueStr) + " (" + e.what() + ")");
    }
}

}  // namespace settlement
