/**
 * @file price_source.hpp
 * @brief Retrieval of cleaned price history for a set of tickers
 *
 * A PriceSource hands the Kelly pipeline a complete price matrix: one column
 * per requested ticker (in request order), ascending dates, no missing
 * values and at least two rows. Anything else is reported as a DataError.
 */

#ifndef KELLY_DATA_PRICE_SOURCE_HPP
#define KELLY_DATA_PRICE_SOURCE_HPP

#include "market_data.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace kelly
{

    /**
     * @class DataError
     * @brief Price history could not be produced for the request
     *
     * Raised for unreadable sources, absent tickers and insufficient rows.
     */
    class DataError : public std::runtime_error
    {
    public:
        explicit DataError(const std::string &message)
            : std::runtime_error(message)
        {
        }
    };

    /**
     * @class PriceSource
     * @brief Abstract provider of price history
     */
    class PriceSource
    {
    public:
        virtual ~PriceSource() = default;

        /**
         * @brief Fetch cleaned closing prices
         * @param tickers Ticker symbols, output columns follow this order
         * @param lookback_days Calendar days of history ending at the latest date
         * @return MarketData with no NaN values and at least 2 rows
         * @throws DataError if the history is missing or too short
         */
        virtual MarketData fetch_prices(const std::vector<std::string> &tickers,
                                        int lookback_days) const = 0;

        virtual std::string get_name() const = 0;

    protected:
        /**
         * @brief Apply the shared cleaning rules to raw history
         *
         * Checks every ticker has data, trims to the lookback window, drops
         * all-NaN rows, forward-fills single gaps and drops remaining NaN rows.
         *
         * @throws DataError if a ticker is absent or fewer than 2 rows remain
         */
        static MarketData clean_history(const MarketData &raw,
                                        const std::vector<std::string> &tickers,
                                        int lookback_days);
    };

    /**
     * @class CsvPriceSource
     * @brief PriceSource backed by a local CSV file (wide or long layout)
     *
     * Usage Example:
     * @code
     * CsvPriceSource source("data/market/prices.csv");
     * MarketData prices = source.fetch_prices({"AAPL", "MSFT"}, 126);
     * @endcode
     */
    class CsvPriceSource : public PriceSource
    {
    public:
        explicit CsvPriceSource(std::string filepath);

        MarketData fetch_prices(const std::vector<std::string> &tickers,
                                int lookback_days) const override;

        std::string get_name() const override;

        const std::string &get_filepath() const { return filepath_; }

    private:
        std::string filepath_;
    };

} // namespace kelly

#endif // KELLY_DATA_PRICE_SOURCE_HPP
