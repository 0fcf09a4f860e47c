/**
 * @file kelly_report.cpp
 * @brief Implementation of Kelly result and warning output
 */

#include "report/kelly_report.hpp"
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace kelly
{
    namespace report
    {

        void print_results(std::ostream &os,
                           const calc::KellyAnalysis &analysis,
                           bool full_kelly)
        {
            const std::ios::fmtflags saved_flags = os.flags();
            const std::streamsize saved_precision = os.precision();

            os << "\n"
               << std::string(60, '=') << "\n";
            os << "Kelly Criterion Capital Allocation\n";
            os << std::string(60, '=') << "\n";

            os << std::left << std::setw(10) << "Ticker" << " "
               << std::right << std::setw(12) << "Full Kelly" << " "
               << std::setw(12) << "Half Kelly" << " "
               << std::setw(12) << "Ann. Excess" << "\n";
            os << std::string(60, '-') << "\n";

            os << std::fixed << std::setprecision(4);
            for (size_t i = 0; i < analysis.tickers.size(); ++i)
            {
                const Eigen::Index k = static_cast<Eigen::Index>(i);
                os << std::left << std::setw(10) << analysis.tickers[i] << " "
                   << std::right << std::setw(12) << analysis.full_kelly(k) << " "
                   << std::setw(12) << analysis.half_kelly(k) << " "
                   << std::setw(12) << analysis.mean_excess(k) << "\n";
            }

            os << std::string(60, '-') << "\n";
            os << "Recommended allocation: " << (full_kelly ? "Full" : "Half") << " Kelly\n";
            os << "Portfolio Sharpe Ratio: " << analysis.sharpe_ratio << "\n";
            os << "Max Growth Rate (CAGR): " << analysis.growth_rate
               << " (" << std::setprecision(2) << analysis.growth_rate * 100 << "%)\n";
            os << std::string(60, '=') << "\n"
               << std::endl;

            os.flags(saved_flags);
            os.precision(saved_precision);
        }

        std::vector<std::string> leverage_warnings(const calc::KellyAnalysis &analysis)
        {
            std::vector<std::string> warnings;

            for (size_t i = 0; i < analysis.tickers.size(); ++i)
            {
                const double f = analysis.full_kelly(static_cast<Eigen::Index>(i));
                if (std::abs(f) > kHighLeverageThreshold)
                {
                    std::ostringstream line;
                    line << "  - " << analysis.tickers[i] << ": Full Kelly leverage is "
                         << std::fixed << std::setprecision(2) << f << "x (implies "
                         << (f > 0 ? "leveraged long" : "short") << " position)";
                    warnings.push_back(line.str());
                }
            }

            return warnings;
        }

        void print_warnings(std::ostream &os, const calc::KellyAnalysis &analysis)
        {
            const auto warnings = leverage_warnings(analysis);
            if (!warnings.empty())
            {
                os << "\nWARNING: High leverage detected:\n";
                for (const auto &w : warnings)
                {
                    os << w << "\n";
                }
            }

            if (analysis.num_observations < kMinReliableObservations)
            {
                os << "\nWARNING: Small sample size (" << analysis.num_observations
                   << " observations). Estimates may be unreliable.\n";
            }

            if (analysis.sharpe_clamped)
            {
                os << "\nWARNING: Sharpe ratio quadratic form was slightly negative due to "
                      "rounding and was clamped to zero. The covariance matrix is close to singular.\n";
            }

            os << "\nDISCLAIMERS:\n";
            os << "  - Kelly criterion assumes returns are Gaussian and i.i.d. "
                  "Real markets deviate significantly from these assumptions.\n";
            os << "  - Results require continuous rebalancing to the target allocation.\n";
            os << "  - Past return distributions may not persist (regime shifts).\n";
            os.flush();
        }

    } // namespace report
} // namespace kelly
