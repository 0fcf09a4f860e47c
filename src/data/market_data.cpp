/**
 * @file market_data.cpp
 * @brief Implementation of the MarketData price history
 */

#include "data/market_data.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace kelly
{

    MarketData::MarketData(size_t num_dates, size_t num_assets)
        : prices_(Eigen::MatrixXd::Zero(num_dates, num_assets))
    {
    }

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price history has " + std::to_string(prices_.rows()) +
                                        " rows but " + std::to_string(dates_.size()) + " dates");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price history has " + std::to_string(prices_.cols()) +
                                        " columns but " + std::to_string(tickers_.size()) + " tickers");
        }

        for (size_t r = 1; r < dates_.size(); ++r)
        {
            if (!(dates_[r - 1] < dates_[r]))
            {
                throw std::invalid_argument("Dates must be strictly ascending, got " + dates_[r] +
                                            " after " + dates_[r - 1]);
            }
        }

        for (size_t c = 0; c < tickers_.size(); ++c)
        {
            column_of_.emplace(tickers_[c], static_cast<Eigen::Index>(c));
        }
    }

    // ================================
    // Transforms
    // ================================

    MarketData MarketData::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        Eigen::MatrixXd selected(prices_.rows(), static_cast<Eigen::Index>(selected_tickers.size()));
        for (size_t c = 0; c < selected_tickers.size(); ++c)
        {
            selected.col(static_cast<Eigen::Index>(c)) = prices_.col(column(selected_tickers[c]));
        }

        return MarketData(selected, dates_, selected_tickers);
    }

    MarketData MarketData::tail_calendar_days(int days) const
    {
        if (days < 0)
        {
            throw std::invalid_argument("Lookback window must be non-negative, got: " + std::to_string(days));
        }
        if (dates_.empty())
        {
            return *this;
        }

        const long last = date_to_days(dates_.back());
        std::vector<bool> keep(dates_.size());
        std::transform(dates_.begin(), dates_.end(), keep.begin(),
                       [last, days](const std::string &date)
                       {
                           const long d = date_to_days(date);
                           return d >= last - days && d <= last;
                       });

        return filter_rows(keep);
    }

    MarketData MarketData::drop_all_missing() const
    {
        std::vector<bool> keep(dates_.size(), true);
        if (prices_.cols() > 0)
        {
            for (Eigen::Index r = 0; r < prices_.rows(); ++r)
            {
                keep[static_cast<size_t>(r)] = !prices_.row(r).array().isNaN().all();
            }
        }

        return filter_rows(keep);
    }

    MarketData MarketData::drop_missing() const
    {
        std::vector<bool> keep(dates_.size());
        for (Eigen::Index r = 0; r < prices_.rows(); ++r)
        {
            keep[static_cast<size_t>(r)] = !prices_.row(r).array().isNaN().any();
        }

        if (!keep.empty() && std::none_of(keep.begin(), keep.end(), [](bool k) { return k; }))
        {
            throw std::runtime_error("Every date has at least one missing price");
        }

        return filter_rows(keep);
    }

    MarketData MarketData::forward_fill(int limit) const
    {
        Eigen::MatrixXd filled = prices_;

        for (Eigen::Index c = 0; c < filled.cols(); ++c)
        {
            Eigen::Index source = -1; // last row with a price
            for (Eigen::Index r = 0; r < filled.rows(); ++r)
            {
                if (!std::isnan(filled(r, c)))
                {
                    source = r;
                }
                else if (source >= 0 && (limit < 0 || r - source <= limit))
                {
                    filled(r, c) = filled(source, c);
                }
            }
        }

        return MarketData(filled, dates_, tickers_);
    }

    // ================================
    // Inspection
    // ================================

    size_t MarketData::count_missing() const
    {
        return static_cast<size_t>(prices_.array().isNaN().count());
    }

    size_t MarketData::count_valid(const std::string &ticker) const
    {
        return static_cast<size_t>((!prices_.col(column(ticker)).array().isNaN()).count());
    }

    void MarketData::print_summary(std::ostream &os) const
    {
        os << "\n=== Price History ===\n";
        os << "Dimensions: " << prices_.rows() << " dates x " << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            os << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        os << "Tickers:";
        for (const auto &ticker : tickers_)
        {
            os << " " << ticker;
        }
        os << "\nMissing values: " << count_missing() << "\n";
        os << "=====================\n"
           << std::endl;
    }

    long MarketData::date_to_days(const std::string &date)
    {
        const bool shaped = date.size() == 10 && date[4] == '-' && date[7] == '-' &&
                            std::all_of(date.begin(), date.end(), [](char ch)
                                        { return ch == '-' || std::isdigit(static_cast<unsigned char>(ch)); });
        if (!shaped)
        {
            throw std::invalid_argument("Malformed date (expected YYYY-MM-DD): " + date);
        }

        long year = std::stol(date.substr(0, 4));
        const long month = std::stol(date.substr(5, 2));
        const long day = std::stol(date.substr(8, 2));
        if (month < 1 || month > 12 || day < 1 || day > 31)
        {
            throw std::invalid_argument("Date out of range: " + date);
        }

        // Shift the year to start in March so the leap day is last
        if (month <= 2)
            --year;
        const long era = (year >= 0 ? year : year - 399) / 400;
        const long yoe = year - era * 400;
        const long doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
        const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    // ================================
    // Helpers
    // ================================

    Eigen::Index MarketData::column(const std::string &ticker) const
    {
        auto it = column_of_.find(ticker);
        if (it == column_of_.end())
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return it->second;
    }

    MarketData MarketData::filter_rows(const std::vector<bool> &keep) const
    {
        std::vector<Eigen::Index> rows;
        std::vector<std::string> kept_dates;
        for (size_t r = 0; r < keep.size(); ++r)
        {
            if (keep[r])
            {
                rows.push_back(static_cast<Eigen::Index>(r));
                kept_dates.push_back(dates_[r]);
            }
        }

        Eigen::MatrixXd kept(static_cast<Eigen::Index>(rows.size()), prices_.cols());
        for (size_t i = 0; i < rows.size(); ++i)
        {
            kept.row(static_cast<Eigen::Index>(i)) = prices_.row(rows[i]);
        }

        return MarketData(kept, kept_dates, tickers_);
    }

} // namespace kelly
