/**
 * @file data_loader.hpp
 * @brief Price history files and analysis configuration
 *
 * Reads daily closing prices from CSV into MarketData, reads the JSON
 * analysis configuration, and writes synthetic price files for tests
 * and demos.
 */

#ifndef KELLY_DATA_DATA_LOADER_HPP
#define KELLY_DATA_DATA_LOADER_HPP

#include "market_data.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>


namespace kelly {

/**
 * @struct DataConfig
 * @brief Where prices come from and which instruments to analyse
 */
struct DataConfig {
    std::string data_file;               ///< Price history CSV
    std::vector<std::string> universe;   ///< Ticker symbols, analysis order

    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct KellyConfig
 * @brief Parameters of the Kelly calculation
 *
 * Defaults: 126 calendar day lookback, 5% risk-free rate, full covariance,
 * half Kelly recommended, 252 trading days per year.
 */
struct KellyConfig {
    int lookback_days = 126;
    double risk_free_rate = 0.05;        ///< Annual, as a fraction
    bool diagonal_only = false;          ///< Zero the cross-covariances
    bool full_kelly = false;             ///< Recommend full instead of half Kelly
    int trading_days_per_year = 252;

    static KellyConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AnalysisConfig
 * @brief Configuration file contents: "data" and "kelly" sections
 */
struct AnalysisConfig {
    DataConfig data;
    KellyConfig kelly;

    /**
     * @throws std::invalid_argument on an out-of-range parameter
     */
    void validate() const;
};

/**
 * @enum CsvLayout
 * @brief Column layout of a price history CSV
 */
enum class CsvLayout {
    Wide,   ///< date,AAPL,MSFT,...
    Long    ///< date,ticker,price
};

/**
 * @class DataLoader
 * @brief Reads and writes price history and configuration files
 *
 * Blank, "nan" and unparseable price cells load as NaN; rows whose date
 * is not YYYY-MM-DD are skipped. Cleaning is left to PriceSource.
 */
class DataLoader {
public:
    // ========================================================================
    // Price History
    // ========================================================================

    /**
     * @brief Load a wide CSV (one column per ticker)
     *
     * Requested tickers absent from the header are skipped; callers that
     * require every ticker must check the returned columns. Rows are
     * returned in ascending date order whatever the file order.
     *
     * @param filepath Path to CSV file
     * @param tickers Columns to keep, in this order (all columns if empty)
     * @throws std::runtime_error if the file cannot be read or repeats a date
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load a long CSV (one row per date and ticker)
     *
     * Dates are sorted; a (date, ticker) pair without a row loads as NaN.
     *
     * @throws std::runtime_error if the file cannot be read or repeats a
     *         (date, ticker) pair
     */
    static MarketData load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Detect the layout from the header and load accordingly
     */
    static MarketData load_csv(const std::string& filepath,
                               const std::vector<std::string>& tickers = {});

    /**
     * @brief Long if the header is "date,ticker,price" (or "symbol"), else wide
     */
    static CsvLayout detect_layout(const std::string& header_line);

    // ========================================================================
    // Configuration
    // ========================================================================

    /**
     * @brief Read and validate a configuration file
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument if a value has the wrong type or range
     */
    static AnalysisConfig load_config(const std::string& config_path);

    /**
     * @brief Build and validate configuration from a parsed document
     * @throws std::invalid_argument if a value has the wrong type or range
     */
    static AnalysisConfig parse_config(const nlohmann::json& j);

    // ========================================================================
    // Synthetic Prices
    // ========================================================================

    /**
     * @brief Independent geometric random walks starting at 100
     * @param tickers Column names
     * @param num_days Rows, one per consecutive calendar day
     * @param start_date First date (YYYY-MM-DD)
     * @param volatility Daily return standard deviation
     * @param drift Daily mean return
     * @param seed Identical seeds give identical prices
     */
    static MarketData generate_synthetic_data(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        std::uint32_t seed = 42
    );

    /**
     * @brief Write prices as a wide CSV, missing values as empty cells
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_csv_wide(const MarketData& data, const std::string& filepath);

private:
    static std::ifstream open_for_reading(const std::string& filepath);

    static std::vector<std::string> split_fields(const std::string& line);
    static std::string strip(const std::string& str);
    static bool is_iso_date(const std::string& date);

    /**
     * @return Parsed price, or NaN for blank or malformed cells
     */
    static double parse_price(const std::string& cell);

    static std::string date_after(const std::string& start_date, int days);
};

} // namespace kelly

#endif // KELLY_DATA_DATA_LOADER_HPP
