/**
 * @file data_loader.cpp
 * @brief Implementation of price history and configuration file handling
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <limits>
#include <locale>
#include <map>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace kelly
{

    namespace
    {
        const double kMissing = std::numeric_limits<double>::quiet_NaN();
    }

    // =============================================
    // Configuration
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_file = j.value("data_file", config.data_file);
        config.universe = j.value("universe", config.universe);
        return config;
    }

    KellyConfig KellyConfig::from_json(const nlohmann::json &j)
    {
        KellyConfig config;
        config.lookback_days = j.value("lookback_days", config.lookback_days);
        config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);
        config.diagonal_only = j.value("diagonal_only", config.diagonal_only);
        config.full_kelly = j.value("full_kelly", config.full_kelly);
        config.trading_days_per_year = j.value("trading_days_per_year", config.trading_days_per_year);
        return config;
    }

    void AnalysisConfig::validate() const
    {
        if (kelly.lookback_days < 1)
        {
            throw std::invalid_argument("kelly.lookback_days must be at least 1, got: " +
                                        std::to_string(kelly.lookback_days));
        }
        if (kelly.trading_days_per_year < 1)
        {
            throw std::invalid_argument("kelly.trading_days_per_year must be at least 1, got: " +
                                        std::to_string(kelly.trading_days_per_year));
        }
        if (!std::isfinite(kelly.risk_free_rate))
        {
            throw std::invalid_argument("kelly.risk_free_rate must be a finite number");
        }
    }

    AnalysisConfig DataLoader::load_config(const std::string &config_path)
    {
        std::ifstream in = open_for_reading(config_path);

        nlohmann::json document;
        try
        {
            in >> document;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("Could not parse " + config_path + ": " + e.what());
        }

        return parse_config(document);
    }

    AnalysisConfig DataLoader::parse_config(const nlohmann::json &j)
    {
        AnalysisConfig config;

        try
        {
            if (j.contains("data"))
                config.data = DataConfig::from_json(j.at("data"));
            if (j.contains("kelly"))
                config.kelly = KellyConfig::from_json(j.at("kelly"));
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration: " + std::string(e.what()));
        }

        config.validate();
        return config;
    }

    // =============================================
    // Price History
    // =============================================

    MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream in = open_for_reading(filepath);

        std::string line;
        if (!std::getline(in, line))
        {
            throw std::runtime_error("Price file is empty: " + filepath);
        }

        const auto header = split_fields(line);
        if (header.empty() || strip(header.front()) != "date")
        {
            throw std::runtime_error("First column of " + filepath + " must be 'date'");
        }

        // Ticker -> field position; duplicated headers keep the first column
        std::unordered_map<std::string, size_t> field_of;
        std::vector<std::string> header_tickers;
        for (size_t f = 1; f < header.size(); ++f)
        {
            const std::string name = strip(header[f]);
            if (field_of.emplace(name, f).second)
                header_tickers.push_back(name);
        }

        const std::vector<std::string> &wanted = tickers.empty() ? header_tickers : tickers;
        std::vector<std::string> columns;
        std::vector<size_t> fields;
        for (const auto &ticker : wanted)
        {
            auto it = field_of.find(ticker);
            if (it == field_of.end())
                continue;
            columns.push_back(ticker);
            fields.push_back(it->second);
        }

        std::vector<std::string> dates;
        std::vector<double> cells; // row-major
        while (std::getline(in, line))
        {
            if (strip(line).empty())
                continue;

            const auto row = split_fields(line);
            const std::string date = strip(row.front());
            if (!is_iso_date(date))
                continue;

            dates.push_back(date);
            for (size_t f : fields)
            {
                cells.push_back(f < row.size() ? parse_price(row[f]) : kMissing);
            }
        }

        // Exports are often newest first; ISO dates sort chronologically as text
        std::vector<size_t> order(dates.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&dates](size_t a, size_t b)
                         { return dates[a] < dates[b]; });

        std::vector<std::string> sorted_dates;
        Eigen::MatrixXd prices(dates.size(), columns.size());
        for (size_t r = 0; r < order.size(); ++r)
        {
            const std::string &date = dates[order[r]];
            if (!sorted_dates.empty() && sorted_dates.back() == date)
            {
                throw std::runtime_error("Duplicate date " + date + " in " + filepath);
            }
            sorted_dates.push_back(date);

            for (size_t c = 0; c < columns.size(); ++c)
            {
                prices(r, c) = cells[order[r] * columns.size() + c];
            }
        }

        return MarketData(prices, sorted_dates, columns);
    }

    MarketData DataLoader::load_csv_long(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream in = open_for_reading(filepath);

        std::string line;
        std::getline(in, line); // header

        // date -> ticker -> close; std::map keeps ISO dates chronological
        std::map<std::string, std::unordered_map<std::string, double>> closes;
        std::vector<std::string> seen; // first appearance order

        while (std::getline(in, line))
        {
            const auto row = split_fields(line);
            if (row.size() < 3)
                continue;

            const std::string date = strip(row[0]);
            const std::string ticker = strip(row[1]);
            if (!is_iso_date(date) || ticker.empty())
                continue;
            if (!tickers.empty() && std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
                continue;

            if (std::find(seen.begin(), seen.end(), ticker) == seen.end())
                seen.push_back(ticker);
            if (!closes[date].emplace(ticker, parse_price(row[2])).second)
            {
                throw std::runtime_error("Duplicate row for " + ticker + " on " + date + " in " + filepath);
            }
        }

        std::vector<std::string> columns;
        if (tickers.empty())
        {
            columns = seen;
            std::sort(columns.begin(), columns.end());
        }
        else
        {
            std::copy_if(tickers.begin(), tickers.end(), std::back_inserter(columns),
                         [&seen](const std::string &t)
                         { return std::find(seen.begin(), seen.end(), t) != seen.end(); });
        }

        std::vector<std::string> dates;
        Eigen::MatrixXd prices = Eigen::MatrixXd::Constant(closes.size(), columns.size(), kMissing);
        for (const auto &day : closes)
        {
            const Eigen::Index r = static_cast<Eigen::Index>(dates.size());
            dates.push_back(day.first);
            for (size_t c = 0; c < columns.size(); ++c)
            {
                auto it = day.second.find(columns[c]);
                if (it != day.second.end())
                    prices(r, static_cast<Eigen::Index>(c)) = it->second;
            }
        }

        return MarketData(prices, dates, columns);
    }

    MarketData DataLoader::load_csv(const std::string &filepath,
                                    const std::vector<std::string> &tickers)
    {
        std::string header;
        {
            std::ifstream in = open_for_reading(filepath);
            std::getline(in, header);
        }

        if (detect_layout(header) == CsvLayout::Long)
            return load_csv_long(filepath, tickers);
        return load_csv_wide(filepath, tickers);
    }

    CsvLayout DataLoader::detect_layout(const std::string &header_line)
    {
        const auto header = split_fields(header_line);
        if (header.size() == 3)
        {
            const std::string second = strip(header[1]);
            if (second == "ticker" || second == "symbol")
                return CsvLayout::Long;
        }
        return CsvLayout::Wide;
    }

    // =============================================
    // Synthetic Prices
    // =============================================

    MarketData DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        std::uint32_t seed)
    {
        std::mt19937 rng(seed);
        std::normal_distribution<double> daily_return(drift, volatility);

        std::vector<std::string> dates(num_days);
        for (size_t d = 0; d < num_days; ++d)
        {
            dates[d] = date_after(start_date, static_cast<int>(d));
        }

        Eigen::MatrixXd prices(num_days, tickers.size());
        if (num_days > 0)
        {
            prices.row(0).setConstant(100.0);
        }
        for (Eigen::Index c = 0; c < prices.cols(); ++c)
        {
            for (Eigen::Index r = 1; r < prices.rows(); ++r)
            {
                // Floor keeps every price strictly positive
                prices(r, c) = prices(r - 1, c) * (1.0 + std::max(daily_return(rng), -0.99));
            }
        }

        return MarketData(prices, dates, tickers);
    }

    void DataLoader::save_csv_wide(const MarketData &data, const std::string &filepath)
    {
        std::ofstream out(filepath);
        if (!out)
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        out << "date";
        for (const auto &ticker : data.get_tickers())
            out << ',' << ticker;
        out << '\n';

        const Eigen::MatrixXd &prices = data.get_Prices();
        out << std::fixed << std::setprecision(6);
        for (size_t r = 0; r < data.num_dates(); ++r)
        {
            out << data.get_dates()[r];
            for (Eigen::Index c = 0; c < prices.cols(); ++c)
            {
                out << ',';
                const double p = prices(static_cast<Eigen::Index>(r), c);
                if (!std::isnan(p))
                    out << p;
            }
            out << '\n';
        }

        if (!out)
        {
            throw std::runtime_error("Failed writing file: " + filepath);
        }
    }

    // =============================================
    // Helpers
    // =============================================

    std::ifstream DataLoader::open_for_reading(const std::string &filepath)
    {
        std::ifstream in(filepath);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }
        return in;
    }

    std::vector<std::string> DataLoader::split_fields(const std::string &line)
    {
        std::vector<std::string> fields(1);
        bool quoted = false;

        for (char c : line)
        {
            if (c == '"')
                quoted = !quoted;
            else if (c == ',' && !quoted)
                fields.emplace_back();
            else
                fields.back() += c;
        }

        return fields;
    }

    std::string DataLoader::strip(const std::string &str)
    {
        const char *ws = " \t\r\n";
        const size_t begin = str.find_first_not_of(ws);
        if (begin == std::string::npos)
            return "";
        return str.substr(begin, str.find_last_not_of(ws) - begin + 1);
    }

    bool DataLoader::is_iso_date(const std::string &date)
    {
        if (date.size() != 10 || date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.size(); ++i)
        {
            if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }
        return true;
    }

    double DataLoader::parse_price(const std::string &cell)
    {
        const std::string text = strip(cell);
        if (text.empty())
            return kMissing;

        std::istringstream in(text);
        in.imbue(std::locale::classic());
        double value = 0.0;
        in >> value;

        // Trailing characters or a failed read leave the cell missing
        if (in.fail() || !in.eof())
            return kMissing;
        return value;
    }

    std::string DataLoader::date_after(const std::string &start_date, int days)
    {
        // Days-from-civil inverse (proleptic Gregorian, UTC)
        const long z = MarketData::date_to_days(start_date) + days + 719468;
        const long era = (z >= 0 ? z : z - 146096) / 146097;
        const long doe = z - era * 146097;
        const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const long mp = (5 * doy + 2) / 153;
        const long day = doy - (153 * mp + 2) / 5 + 1;
        const long month = mp < 10 ? mp + 3 : mp - 9;
        const long year = yoe + era * 400 + (month <= 2 ? 1 : 0);

        std::ostringstream out;
        out << std::setfill('0') << std::setw(4) << year << '-'
            << std::setw(2) << month << '-' << std::setw(2) << day;
        return out.str();
    }

} // namespace kelly
