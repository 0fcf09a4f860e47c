/**
 * @file kelly_report.hpp
 * @brief Console presentation of a Kelly analysis
 *
 * Results are meant for stdout and warnings for stderr; both take the
 * destination stream so callers and tests choose where text goes.
 */

#pragma once

#include "calc/kelly_analyzer.hpp"
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace kelly
{
    namespace report
    {

        /// |F| above this is reported as high leverage
        constexpr double kHighLeverageThreshold = 1.0;

        /// Fewer return observations than this trigger a sample size warning
        constexpr size_t kMinReliableObservations = 60;

        /**
         * @brief Print the allocation table and portfolio statistics
         * @param os Destination stream
         * @param analysis Result of KellyAnalyzer::analyze
         * @param full_kelly Recommend full Kelly instead of half Kelly
         */
        void print_results(std::ostream &os,
                           const calc::KellyAnalysis &analysis,
                           bool full_kelly = false);

        /**
         * @brief Build the high leverage warning lines, one per instrument with |F| > 1
         */
        std::vector<std::string> leverage_warnings(const calc::KellyAnalysis &analysis);

        /**
         * @brief Print leverage, sample size and numerical warnings plus disclaimers
         */
        void print_warnings(std::ostream &os, const calc::KellyAnalysis &analysis);

    } // namespace report
} // namespace kelly
