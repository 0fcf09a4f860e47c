/**
 * @file price_source.cpp
 * @brief Implementation of price history cleaning and the CSV source
 */

#include "data/price_source.hpp"
#include "data/data_loader.hpp"
#include <utility>

namespace kelly
{
    namespace
    {
        std::string join_tickers(const std::vector<std::string> &tickers)
        {
            std::string joined = "[";
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                if (i > 0)
                {
                    joined += ", ";
                }
                joined += tickers[i];
            }
            return joined + "]";
        }
    } // namespace

    // ============================================================================
    // PriceSource
    // ============================================================================

    MarketData PriceSource::clean_history(const MarketData &raw,
                                          const std::vector<std::string> &tickers,
                                          int lookback_days)
    {
        if (tickers.empty())
        {
            throw DataError("No tickers requested");
        }

        if (raw.num_dates() == 0)
        {
            throw DataError("No data returned for tickers: " + join_tickers(tickers));
        }

        for (const auto &ticker : tickers)
        {
            if (!raw.has_ticker(ticker) || raw.count_valid(ticker) == 0)
            {
                throw DataError("No data returned for ticker: " + ticker);
            }
        }

        MarketData prices = raw.select_assets(tickers);

        try
        {
            prices = prices.tail_calendar_days(lookback_days);
        }
        catch (const std::invalid_argument &e)
        {
            throw DataError(std::string("Invalid price history: ") + e.what());
        }

        prices = prices.drop_all_missing().forward_fill(1);

        try
        {
            prices = prices.drop_missing();
        }
        catch (const std::runtime_error &)
        {
            throw DataError("Insufficient data: got 0 rows, need at least 2");
        }

        if (prices.num_dates() < 2)
        {
            throw DataError("Insufficient data: got " + std::to_string(prices.num_dates()) +
                            " rows, need at least 2");
        }

        return prices;
    }

    // ============================================================================
    // CsvPriceSource
    // ============================================================================

    CsvPriceSource::CsvPriceSource(std::string filepath) : filepath_(std::move(filepath))
    {
    }

    MarketData CsvPriceSource::fetch_prices(const std::vector<std::string> &tickers,
                                            int lookback_days) const
    {
        MarketData raw(0, 0);
        try
        {
            raw = DataLoader::load_csv(filepath_, tickers);
        }
        catch (const std::runtime_error &e)
        {
            throw DataError(e.what());
        }

        return clean_history(raw, tickers, lookback_days);
    }

    std::string CsvPriceSource::get_name() const
    {
        return "CsvPriceSource";
    }

} // namespace kelly
