#pragma once

#include "SettlementTypes.hpp"
#include "SettlementConfiguration.hpp"
#include <expected>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Чтение файлов
// ═══════════════════════════════════════════════════════════════════════════════

// Абстрактный интерфейс для чтения файлов
class IFileReader {
public:
    virtual ~IFileReader() = default;
    virtual std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) = 0;
};

// Реальная реализация для чтения файлов
class FileReader : public IFileReader {
public:
    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Результат загрузки
// ═══════════════════════════════════════════════════════════════════════════════

struct LoadReport {
    std::vector<Transaction> transactions;
    std::vector<std::string> errors;   // "Row N: причина", N - номер строки данных с 1
    std::size_t totalRows = 0;
    std::size_t skippedRows = 0;       // Нулевое количество или неизвестный тип
};

// ═══════════════════════════════════════════════════════════════════════════════
// Transaction CSV Source
// ═══════════════════════════════════════════════════════════════════════════════

class TransactionCsvSource {
public:
    explicit TransactionCsvSource(
        std::shared_ptr<IFileReader> reader = nullptr,
        char delimiter = ',');

    // Первая строка - заголовок. Ошибки отдельных строк не прерывают загрузку;
    // unexpected только если файл не прочитан или нет заголовка.
    std::expected<LoadReport, std::string> load(
        std::string_view filePath,
        const SettlementConfiguration& configuration) const;

    LoadReport parseLines(
        const std::vector<std::string>& lines,
        const SettlementConfiguration& configuration) const;

private:
    using Row = std::map<std::string, std::string>;   // Нормализованный заголовок -> значение

    std::shared_ptr<IFileReader> reader_;
    char delimiter_;

    std::vector<std::string> parseCSVLine(std::string_view line) const;

    static std::string normalizeHeader(std::string_view header);

    // Первое непустое значение среди колонок-синонимов
    static std::optional<std::string> lookup(
        const Row& row, std::initializer_list<std::string_view> aliases);

    static std::expected<double, std::string> parseNumber(
        std::string_view column, std::string_view valueStr);

    // Строка данных -> сделка; std::nullopt - строка пропущена
    std::expected<std::optional<Transaction>, std::string> parseRow(
        const Row& row,
        std::size_t rowNumber,
        std::size_t loadedCount,
        const SettlementConfiguration& configuration) const;
};

}  // namespace settlement
