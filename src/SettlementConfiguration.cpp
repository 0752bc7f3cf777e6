#include "SettlementConfiguration.hpp"
#include "DateUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace settlement {

namespace {

// Конец открытого последнего интервала графика
TimePoint openEnd()
{
    return makeDate(2199, 12, 31, 23, 59, 59);
}

TimePoint endOfDay(int year, int month, int day)
{
    return makeDate(year, month, day, 23, 59, 59);
}

// ═══════════════════════════════════════════════════════════════════════════════
// TWITTER: класс 06.02.2015 - 28.07.2015, раскрытие 28.04.2015 в 15:07
// ═══════════════════════════════════════════════════════════════════════════════

std::map<TimePoint, double> twitterAverageClosingPrices()
{
    // Таблица 2 уведомления: скользящая средняя цена закрытия за lookback
    return {
        // Август 2015
        {makeDate(2015, 8, 3), 29.27},  {makeDate(2015, 8, 4), 29.31},
        {makeDate(2015, 8, 5), 29.03},  {makeDate(2015, 8, 6), 28.66},
        {makeDate(2015, 8, 7), 28.33},  {makeDate(2015, 8, 10), 28.35},
        {makeDate(2015, 8, 11), 28.33}, {makeDate(2015, 8, 12), 28.59},
        {makeDate(2015, 8, 13), 28.45}, {makeDate(2015, 8, 14), 28.40},
        {makeDate(2015, 8, 17), 28.23}, {makeDate(2015, 8, 18), 28.48},
        {makeDate(2015, 8, 19), 27.94}, {makeDate(2015, 8, 20), 27.72},
        {makeDate(2015, 8, 21), 27.37}, {makeDate(2015, 8, 24), 26.47},
        {makeDate(2015, 8, 25), 26.60}, {makeDate(2015, 8, 26), 26.94},
        {makeDate(2015, 8, 27), 27.73}, {makeDate(2015, 8, 28), 27.74},
        {makeDate(2015, 8, 31), 27.87},
        // Сентябрь 2015
        {makeDate(2015, 9, 1), 26.87},  {makeDate(2015, 9, 2), 27.27},
        {makeDate(2015, 9, 3), 27.69},  {makeDate(2015, 9, 4), 27.02},
        {makeDate(2015, 9, 8), 27.63},  {makeDate(2015, 9, 9), 27.92},
        {makeDate(2015, 9, 10), 27.83}, {makeDate(2015, 9, 11), 27.79},
        {makeDate(2015, 9, 14), 27.63}, {makeDate(2015, 9, 15), 27.73},
        {makeDate(2015, 9, 16), 27.69}, {makeDate(2015, 9, 17), 27.66},
        {makeDate(2015, 9, 18), 27.62}, {makeDate(2015, 9, 21), 27.35},
        {makeDate(2015, 9, 22), 27.32}, {makeDate(2015, 9, 23), 27.27},
        {makeDate(2015, 9, 24), 26.59}, {makeDate(2015, 9, 25), 26.42},
        {makeDate(2015, 9, 28), 26.64}, {makeDate(2015, 9, 29), 27.21},
        {makeDate(2015, 9, 30), 27.25},
        // Октябрь 2015
        {makeDate(2015, 10, 1), 27.04},  {makeDate(2015, 10, 2), 27.55},
        {makeDate(2015, 10, 5), 27.75},  {makeDate(2015, 10, 6), 28.27},
        {makeDate(2015, 10, 7), 28.37},  {makeDate(2015, 10, 8), 28.74},
        {makeDate(2015, 10, 9), 28.82},  {makeDate(2015, 10, 12), 28.95},
        {makeDate(2015, 10, 13), 28.86}, {makeDate(2015, 10, 14), 28.71},
        {makeDate(2015, 10, 15), 29.02}, {makeDate(2015, 10, 16), 29.36},
        {makeDate(2015, 10, 19), 29.52}, {makeDate(2015, 10, 20), 29.56},
        {makeDate(2015, 10, 21), 29.60}, {makeDate(2015, 10, 22), 29.64},
        {makeDate(2015, 10, 23), 29.46}, {makeDate(2015, 10, 26), 29.35},
        {makeDate(2015, 10, 27), 28.96}, {makeDate(2015, 10, 28), 29.09},
        {makeDate(2015, 10, 29), 28.47}, {makeDate(2015, 10, 30), 28.06},
    };
}

std::expected<ConfigurationPtr, std::string> buildTwitterConfiguration()
{
    const TimePoint disclosure = makeDate(2015, 4, 28, 15, 7, 0);

    std::vector<TimeGroup> groups = {
        {"2/6/2015-4/28/2015 before 3:07pm",
         makeDate(2015, 2, 6), disclosure - std::chrono::seconds(1), 0},
        {"4/28/2015 at/after 3:07pm",
         disclosure, endOfDay(2015, 4, 28), 1},
        {"4/29/2015-7/28/2015",
         makeDate(2015, 4, 29), endOfDay(2015, 7, 28), 2},
        {"7/29/2015-7/30/2015",
         makeDate(2015, 7, 29), endOfDay(2015, 7, 30), 3},
        {"7/31/2015",
         makeDate(2015, 7, 31), endOfDay(2015, 7, 31), 4},
        {"8/1/2015 and beyond",
         makeDate(2015, 8, 1), openEnd(), 5},
    };

    // Таблица 1 уведомления: строка - группа покупки, столбец - группа продажи
    const DeclineMatrix::Table table = {{
        {0.00, 8.97, 12.93, 18.27, 18.69, 20.34},
        {0.00, 0.00, 3.96, 9.30, 9.72, 11.37},
        {0.00, 0.00, 0.00, 5.34, 5.76, 7.41},
        {0.00, 0.00, 0.00, 0.00, 0.00, 0.00},
        {0.00, 0.00, 0.00, 0.00, 0.00, 0.00},
        {0.00, 0.00, 0.00, 0.00, 0.00, 0.00},
    }};

    auto matrix = DeclineMatrix::create(std::move(groups), table, disclosure, 50.45);
    if (!matrix) {
        return std::unexpected("Invalid TWITTER decline matrix: " + matrix.error());
    }

    SettlementConfiguration::Periods periods;
    periods.classStart = makeDate(2015, 2, 6);
    periods.classEnd = makeDate(2015, 7, 28);
    periods.lookbackStart = makeDate(2015, 8, 3);
    periods.lookbackEnd = makeDate(2015, 10, 30);
    periods.correctiveDates = {makeDate(2015, 4, 28)};
    periods.averagePrice = 28.06;

    return SettlementConfiguration::assemble(
        SettlementType::Twitter,
        std::move(periods),
        twitterAverageClosingPrices(),
        std::move(*matrix),
        std::nullopt);
}

// ═══════════════════════════════════════════════════════════════════════════════
// KRAFT_HEINZ: класс 06.11.2015 - 07.08.2019, три корректирующих раскрытия
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<ConfigurationPtr, std::string> buildKraftHeinzConfiguration()
{
    // Таблица A уведомления
    std::vector<InflationPeriod> periods = {
        {makeDate(2015, 11, 6), makeDate(2018, 11, 1), 12.59, "Before 11/2/2018", false},
        {makeDate(2018, 11, 2), makeDate(2019, 2, 21), 10.93, "11/2/2018 - 2/21/2019", false},
        {makeDate(2019, 2, 22), makeDate(2019, 8, 7), 4.04, "2/22/2019 - 8/7/2019", false},
        {makeDate(2019, 8, 8), makeDate(2019, 8, 8), 1.33, "8/8/2019 (sale only)", true},
        {makeDate(2019, 8, 9), normalizeDate(openEnd()), 0.00, "After 8/8/2019", false},
    };

    auto schedule = InflationSchedule::create(std::move(periods));
    if (!schedule) {
        return std::unexpected("Invalid KRAFT_HEINZ inflation schedule: " + schedule.error());
    }

    SettlementConfiguration::Periods classPeriods;
    classPeriods.classStart = makeDate(2015, 11, 6);
    classPeriods.classEnd = makeDate(2019, 8, 7);
    classPeriods.lookbackStart = makeDate(2019, 8, 8);
    classPeriods.lookbackEnd = makeDate(2019, 11, 5);
    classPeriods.correctiveDates = {
        makeDate(2018, 11, 2),   // 1 ноября 2018 после закрытия
        makeDate(2019, 2, 22),   // 21 февраля 2019 после закрытия
        makeDate(2019, 8, 8),    // 8 августа 2019 до открытия
    };
    classPeriods.averagePrice = 27.55;

    // Таблица B опубликована только итоговым значением;
    // остальные дни берут среднюю за lookback
    std::map<TimePoint, double> averageClosingPrices = {
        {makeDate(2019, 11, 5), 27.55},
    };

    return SettlementConfiguration::assemble(
        SettlementType::KraftHeinz,
        std::move(classPeriods),
        std::move(averageClosingPrices),
        std::nullopt,
        std::move(*schedule));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Тип соглашения
// ═══════════════════════════════════════════════════════════════════════════════

std::string_view toString(SettlementType type) noexcept
{
    switch (type) {
        case SettlementType::Twitter:
            return "TWITTER";
        case SettlementType::KraftHeinz:
            return "KRAFT_HEINZ";
    }
    return "UNKNOWN";
}

std::string_view toString(LossMethod method) noexcept
{
    switch (method) {
        case LossMethod::DeclineMatrix:
            return "decline-matrix";
        case LossMethod::InflationSchedule:
            return "inflation-schedule";
    }
    return "unknown";
}

std::expected<SettlementType, std::string> parseSettlementType(std::string_view selector)
{
    std::string normalized(selector);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::replace(normalized.begin(), normalized.end(), '-', '_');

    if (normalized == "TWITTER") {
        return SettlementType::Twitter;
    }
    if (normalized == "KRAFT_HEINZ") {
        return SettlementType::KraftHeinz;
    }

    return std::unexpected("Unknown settlement type: '" + std::string(selector) +
                           "'. Supported: TWITTER, KRAFT_HEINZ");
}

// ═══════════════════════════════════════════════════════════════════════════════
// DeclineMatrix
// ═══════════════════════════════════════════════════════════════════════════════

DeclineMatrix::DeclineMatrix(
    std::vector<TimeGroup> groups,
    const Table& table,
    TimePoint disclosureTime,
    double priceThreshold)
    : groups_(std::move(groups)),
      table_(table),
      disclosureTime_(disclosureTime),
      priceThreshold_(priceThreshold)
{
}

std::expected<DeclineMatrix, std::string> DeclineMatrix::create(
    std::vector<TimeGroup> groups,
    const Table& table,
    const TimePoint& disclosureTime,
    double priceThreshold)
{
    if (groups.size() != kGroupCount) {
        return std::unexpected("Expected " + std::to_string(kGroupCount) +
                               " time groups, got " + std::to_string(groups.size()));
    }

    for (std::size_t i = 0; i < groups.size(); ++i) {
        const auto& group = groups[i];

        if (group.index != i) {
            return std::unexpected("Time group '" + group.name + "' has index " +
                                   std::to_string(group.index) + ", expected " +
                                   std::to_string(i));
        }

        if (group.end < group.start) {
            return std::unexpected("Time group '" + group.name + "' ends before it starts");
        }

        // Группы идут без разрывов с точностью до секунды
        if (i > 0 && groups[i - 1].end + std::chrono::seconds(1) != group.start) {
            return std::unexpected("Gap or overlap between time groups '" +
                                   groups[i - 1].name + "' and '" + group.name + "'");
        }
    }

    for (std::size_t purchase = 0; purchase < kGroupCount; ++purchase) {
        for (std::size_t sale = 0; sale < kGroupCount; ++sale) {
            double amount = table[purchase][sale];

            if (amount < 0.0) {
                return std::unexpected("Negative decline amount at (" +
                                       std::to_string(purchase) + ", " +
                                       std::to_string(sale) + ")");
            }

            if (sale < purchase && amount != 0.0) {
                return std::unexpected("Decline defined for sale group before purchase group at (" +
                                       std::to_string(purchase) + ", " +
                                       std::to_string(sale) + ")");
            }
        }
    }

    if (priceThreshold <= 0.0) {
        return std::unexpected("Disclosure price threshold must be positive");
    }

    return DeclineMatrix(std::move(groups), table, disclosureTime, priceThreshold);
}

std::optional<std::size_t> DeclineMatrix::groupIndex(const TimePoint& date) const noexcept
{
    for (const auto& group : groups_) {
        if (group.contains(date)) {
            return group.index;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> DeclineMatrix::saleGroupIndex(
    const TimePoint& saleDate,
    std::optional<double> salePriceHint) const noexcept
{
    if (!isSameDay(saleDate, disclosureTime_)) {
        return groupIndex(saleDate);
    }

    auto preDisclosure = groupIndex(disclosureTime_ - std::chrono::seconds(1));
    auto postDisclosure = groupIndex(disclosureTime_);
    if (!preDisclosure || !postDisclosure) {
        return std::nullopt;
    }

    // Время сделки известно
    if (hasTimeOfDay(saleDate)) {
        return timeOfDay(saleDate) >= timeOfDay(disclosureTime_) ? postDisclosure : preDisclosure;
    }

    // Только цена: сделки по цене не ниже порога прошли до раскрытия
    if (salePriceHint && *salePriceHint > 0.0) {
        return *salePriceHint >= priceThreshold_ ? preDisclosure : postDisclosure;
    }

    return postDisclosure;
}

double DeclineMatrix::decline(
    const TimePoint& purchaseDate,
    const TimePoint& saleDate,
    std::optional<double> salePriceHint) const noexcept
{
    auto purchaseGroup = groupIndex(purchaseDate);
    auto saleGroup = saleGroupIndex(saleDate, salePriceHint);

    if (!purchaseGroup || !saleGroup) {
        return 0.0;
    }

    return declineForGroups(*purchaseGroup, *saleGroup);
}

double DeclineMatrix::declineForGroups(std::size_t purchaseGroup, std::size_t saleGroup) const noexcept
{
    if (purchaseGroup >= kGroupCount || saleGroup >= kGroupCount || saleGroup < purchaseGroup) {
        return 0.0;
    }
    return table_[purchaseGroup][saleGroup];
}

// ═══════════════════════════════════════════════════════════════════════════════
// InflationSchedule
// ═══════════════════════════════════════════════════════════════════════════════

bool InflationPeriod::contains(const TimePoint& date) const noexcept
{
    auto day = normalizeDate(date);
    return start <= day && day <= end;
}

InflationSchedule::InflationSchedule(std::vector<InflationPeriod> periods)
    : periods_(std::move(periods))
{
}

std::expected<InflationSchedule, std::string> InflationSchedule::create(
    std::vector<InflationPeriod> periods)
{
    if (periods.empty()) {
        return std::unexpected("Inflation schedule is empty");
    }

    for (std::size_t i = 0; i < periods.size(); ++i) {
        auto& period = periods[i];
        period.start = normalizeDate(period.start);
        period.end = normalizeDate(period.end);

        if (period.end < period.start) {
            return std::unexpected("Inflation period '" + period.label + "' ends before it starts");
        }

        if (period.inflation < 0.0) {
            return std::unexpected("Negative inflation in period '" + period.label + "'");
        }

        if (i > 0 && periods[i - 1].end >= period.start) {
            return std::unexpected("Inflation periods '" + periods[i - 1].label +
                                   "' and '" + period.label + "' overlap or are out of order");
        }
    }

    return InflationSchedule(std::move(periods));
}

double InflationSchedule::inflation(const TimePoint& date, bool isSale) const noexcept
{
    for (const auto& period : periods_) {
        if (!period.contains(date)) {
            continue;
        }
        if (period.saleOnly && !isSale) {
            continue;
        }
        return period.inflation;
    }
    return 0.0;
}

// ═══════════════════════════════════════════════════════════════════════════════
// SettlementConfiguration
// ═══════════════════════════════════════════════════════════════════════════════

SettlementConfiguration::SettlementConfiguration(
    SettlementType type,
    Periods periods,
    std::map<TimePoint, double> averageClosingPrices,
    std::optional<DeclineMatrix> declineMatrix,
    std::optional<InflationSchedule> inflationSchedule)
    : type_(type),
      periods_(std::move(periods)),
      averageClosingPrices_(std::move(averageClosingPrices)),
      declineMatrix_(std::move(declineMatrix)),
      inflationSchedule_(std::move(inflationSchedule))
{
}

std::expected<ConfigurationPtr, std::string> SettlementConfiguration::create(SettlementType type)
{
    switch (type) {
        case SettlementType::Twitter:
            return buildTwitterConfiguration();
        case SettlementType::KraftHeinz:
            return buildKraftHeinzConfiguration();
    }
    return std::unexpected("Unsupported settlement type");
}

std::expected<ConfigurationPtr, std::string> SettlementConfiguration::create(std::string_view selector)
{
    auto type = parseSettlementType(selector);
    if (!type) {
        return std::unexpected(type.error());
    }
    return create(*type);
}

std::expected<ConfigurationPtr, std::string> SettlementConfiguration::assemble(
    SettlementType type,
    Periods periods,
    std::map<TimePoint, double> averageClosingPrices,
    std::optional<DeclineMatrix> declineMatrix,
    std::optional<InflationSchedule> inflationSchedule)
{
    if (declineMatrix.has_value() == inflationSchedule.has_value()) {
        return std::unexpected(
            "Exactly one of decline matrix or inflation schedule must be configured");
    }

    if (periods.correctiveDates.empty()) {
        return std::unexpected("At least one corrective disclosure date is required");
    }

    periods.classStart = normalizeDate(periods.classStart);
    periods.classEnd = normalizeDate(periods.classEnd);
    periods.lookbackStart = normalizeDate(periods.lookbackStart);
    periods.lookbackEnd = normalizeDate(periods.lookbackEnd);
    for (auto& date : periods.correctiveDates) {
        date = normalizeDate(date);
    }
    std::sort(periods.correctiveDates.begin(), periods.correctiveDates.end());

    if (periods.classEnd < periods.classStart) {
        return std::unexpected("Class period ends before it starts");
    }

    if (periods.lookbackEnd < periods.lookbackStart) {
        return std::unexpected("Lookback period ends before it starts");
    }

    if (periods.lookbackStart <= periods.classEnd) {
        return std::unexpected("Lookback period must start after the class period");
    }

    if (periods.averagePrice <= 0.0) {
        return std::unexpected("Average lookback price must be positive");
    }

    std::map<TimePoint, double> normalizedPrices;
    for (const auto& [date, price] : averageClosingPrices) {
        if (price <= 0.0) {
            return std::unexpected("Average closing price must be positive on " + formatDate(date));
        }
        normalizedPrices[normalizeDate(date)] = price;
    }

    return std::make_shared<const SettlementConfiguration>(
        type,
        std::move(periods),
        std::move(normalizedPrices),
        std::move(declineMatrix),
        std::move(inflationSchedule));
}

LossMethod SettlementConfiguration::method() const noexcept
{
    return declineMatrix_ ? LossMethod::DeclineMatrix : LossMethod::InflationSchedule;
}

bool SettlementConfiguration::isWithinClassPeriod(const TimePoint& date) const noexcept
{
    auto day = normalizeDate(date);
    return periods_.classStart <= day && day <= periods_.classEnd;
}

bool SettlementConfiguration::isWithinLookbackPeriod(const TimePoint& date) const noexcept
{
    auto day = normalizeDate(date);
    return periods_.lookbackStart <= day && day <= periods_.lookbackEnd;
}

double SettlementConfiguration::averageClosingPrice(const TimePoint& date) const noexcept
{
    auto it = averageClosingPrices_.find(normalizeDate(date));
    if (it != averageClosingPrices_.end()) {
        return it->second;
    }
    return periods_.averagePrice;
}

double SettlementConfiguration::decline(
    const TimePoint& purchaseDate,
    const TimePoint& saleDate,
    std::optional<double> salePriceHint) const noexcept
{
    if (!declineMatrix_) {
        return 0.0;
    }
    return declineMatrix_->decline(purchaseDate, saleDate, salePriceHint);
}

double SettlementConfiguration::inflation(const TimePoint& date, bool isSale) const noexcept
{
    if (!inflationSchedule_) {
        return 0.0;
    }
    return inflationSchedule_->inflation(date, isSale);
}

}  // namespace settlement
