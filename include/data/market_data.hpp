/*
 * @file market_data.hpp
 * @brief Daily closing prices for a fixed set of instruments.
 *
 * Rows are trading dates in ascending ISO order, columns are ticker
 * symbols. Gaps are NaN until PriceSource cleans them; the Kelly
 * pipeline only ever sees a complete matrix.
 */

#ifndef KELLY_DATA_MARKET_DATA_HPP
#define KELLY_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace kelly
{
    /**
     * @class MarketData
     * @brief Immutable price history; every transform returns a new object.
     */
    class MarketData
    {
    public:
        /**
         * @brief Zero prices with empty date and ticker labels.
         */
        MarketData(size_t num_dates, size_t num_assets);

        /**
         * @param prices Closing prices (dates x tickers), NaN for a gap
         * @param dates YYYY-MM-DD labels, strictly ascending
         * @param tickers Column symbols
         * @throws std::invalid_argument if the labels do not match the matrix shape
         *         or the dates are out of order or repeated
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        /** ===========================================
         *  Access
         *  ===========================================
         */

        const Eigen::MatrixXd &get_Prices() const
        {
            return prices_;
        }

        const std::vector<std::string> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return static_cast<size_t>(prices_.rows());
        }

        size_t num_assets() const
        {
            return static_cast<size_t>(prices_.cols());
        }

        bool has_ticker(const std::string &ticker) const
        {
            return column_of_.count(ticker) > 0;
        }

        /** ===========================================
         *  Transforms
         *  ===========================================
         */

        /**
         * @brief Columns for the given tickers, in the given order
         * @throws std::invalid_argument if a ticker is not present
         */
        MarketData select_assets(const std::vector<std::string> &selected_tickers) const;

        /**
         * @brief Rows dated within [last - days, last], last being the final date
         * @throws std::invalid_argument if days < 0 or a date cannot be parsed
         */
        MarketData tail_calendar_days(int days) const;

        /**
         * @brief Drop dates on which no instrument has a price
         */
        MarketData drop_all_missing() const;

        /**
         * @brief Drop dates on which any instrument lacks a price
         * @throws std::runtime_error if that would drop every date
         */
        MarketData drop_missing() const;

        /**
         * @brief Carry the last known price into following gaps
         * @param limit At most this many consecutive gaps are filled per run (-1 for all)
         */
        MarketData forward_fill(int limit = -1) const;

        /** ===========================================
         *  Inspection
         *  ===========================================
         */

        size_t count_missing() const;

        /**
         * @brief Number of dates with a price for one ticker
         * @throws std::invalid_argument if the ticker is unknown
         */
        size_t count_valid(const std::string &ticker) const;

        void print_summary(std::ostream &os) const;

        /**
         * @brief Days since 1970-01-01 for a YYYY-MM-DD date (proleptic Gregorian)
         * @throws std::invalid_argument on malformed dates
         */
        static long date_to_days(const std::string &date);

    private:
        Eigen::Index column(const std::string &ticker) const;

        /// Rows where keep[i] is true, labels carried along
        MarketData filter_rows(const std::vector<bool> &keep) const;

        Eigen::MatrixXd prices_;
        std::vector<std::string> dates_;
        std::vector<std::string> tickers_;
        std::unordered_map<std::string, Eigen::Index> column_of_;
    };

}
#endif // KELLY_DATA_MARKET_DATA_HPP
