/**
 * @file main.cpp
 * @brief Main entry point for the Kelly allocator
 *
 * Command-line application that loads price history, runs the Kelly
 * calculation and prints the recommended leverage with warnings.
 */

#include "calc/errors.hpp"
#include "calc/kelly_analyzer.hpp"
#include "data/data_loader.hpp"
#include "data/price_source.hpp"
#include "report/kelly_report.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <optional>
#include <string>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <vector>

using namespace kelly;

namespace
{
    constexpr int kExitSuccess = 0;
    constexpr int kExitUsage = 1;
    constexpr int kExitFailure = 2;
}

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Kelly Allocator v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS] TICKER [TICKER...]\n\n"
              << "Options:\n"
              << "  --data PATH             Price history CSV (wide or long format)\n"
              << "  --config PATH           JSON configuration file\n"
              << "  --lookback DAYS         Lookback period in calendar days (default: 126)\n"
              << "  --risk-free-rate RATE   Annual risk-free rate (default: 0.05)\n"
              << "  --diagonal              Use only diagonal covariance (ignore correlations)\n"
              << "  --full-kelly            Recommend full Kelly instead of half Kelly\n"
              << "  --verbose               Enable verbose logging\n"
              << "  --help, -h              Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --data data/market/historical_prices.csv AAPL MSFT JPM\n"
              << "  " << program_name << " --config data/config/kelly_config.json --full-kelly\n"
              << std::endl;
}

/**
 * @brief Parsed command-line arguments
 *
 * Optional fields are only set when the flag was given, so they can
 * override values from the configuration file.
 */
struct CommandLineArgs
{
    std::vector<std::string> tickers;
    std::string data_path;
    std::string config_path;
    std::optional<int> lookback_days;
    std::optional<double> risk_free_rate;
    bool diagonal = false;
    bool full_kelly = false;
    bool verbose = false;
    bool show_help = false;
    std::string error;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc && args.error.empty(); ++i)
        {
            std::string arg = argv[i];

            try
            {
                if (arg == "--help" || arg == "-h")
                {
                    args.show_help = true;
                }
                else if (arg == "--data" && i + 1 < argc)
                {
                    args.data_path = argv[++i];
                }
                else if (arg == "--config" && i + 1 < argc)
                {
                    args.config_path = argv[++i];
                }
                else if (arg == "--lookback" && i + 1 < argc)
                {
                    args.lookback_days = parse_number<int>(argv[++i], arg);
                }
                else if (arg == "--risk-free-rate" && i + 1 < argc)
                {
                    args.risk_free_rate = parse_number<double>(argv[++i], arg);
                }
                else if (arg == "--diagonal")
                {
                    args.diagonal = true;
                }
                else if (arg == "--full-kelly")
                {
                    args.full_kelly = true;
                }
                else if (arg == "--verbose")
                {
                    args.verbose = true;
                }
                else if (!arg.empty() && arg[0] == '-')
                {
                    args.error = "Unknown or incomplete argument: " + arg;
                }
                else
                {
                    std::transform(arg.begin(), arg.end(), arg.begin(),
                                   [](unsigned char c)
                                   { return static_cast<char>(std::toupper(c)); });
                    args.tickers.push_back(arg);
                }
            }
            catch (const std::exception &)
            {
                args.error = "Invalid value for " + arg + ": " + argv[i];
            }
        }

        return args;
    }

private:
    template <typename T>
    static T parse_number(const std::string &text, const std::string &flag)
    {
        size_t consumed = 0;
        T value;
        if constexpr (std::is_same<T, int>::value)
        {
            value = std::stoi(text, &consumed);
        }
        else
        {
            value = std::stod(text, &consumed);
        }
        if (consumed != text.size())
        {
            throw std::invalid_argument("Trailing characters in " + flag + " value: " + text);
        }
        return value;
    }
};

/**
 * @brief Merge configuration file and command-line flags
 * @throws std::invalid_argument on an invalid combination
 */
AnalysisConfig resolve_config(const CommandLineArgs &args)
{
    AnalysisConfig config;
    if (!args.config_path.empty())
    {
        config = DataLoader::load_config(args.config_path);
    }

    if (!args.tickers.empty())
    {
        config.data.universe = args.tickers;
    }
    else
    {
        for (auto &ticker : config.data.universe)
        {
            std::transform(ticker.begin(), ticker.end(), ticker.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
        }
    }
    if (!args.data_path.empty())
    {
        config.data.data_file = args.data_path;
    }
    if (args.lookback_days)
    {
        config.kelly.lookback_days = *args.lookback_days;
    }
    if (args.risk_free_rate)
    {
        config.kelly.risk_free_rate = *args.risk_free_rate;
    }
    config.kelly.diagonal_only = config.kelly.diagonal_only || args.diagonal;
    config.kelly.full_kelly = config.kelly.full_kelly || args.full_kelly;

    if (config.data.universe.empty())
    {
        throw std::invalid_argument("At least one ticker is required");
    }
    if (config.data.data_file.empty())
    {
        throw std::invalid_argument("No price history given (use --data or data.data_file in the config)");
    }

    config.validate();
    return config;
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    AnalysisConfig config;
    try
    {
        config = resolve_config(args);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitUsage;
    }

    if (args.verbose)
    {
        std::cout << "[1/3] Loading price history..." << std::endl;
        std::cout << "  - Tickers: ";
        for (const auto &ticker : config.data.universe)
        {
            std::cout << ticker << " ";
        }
        std::cout << "\n  - Source: " << config.data.data_file
                  << "\n  - Lookback: " << config.kelly.lookback_days << " days\n";
    }

    CsvPriceSource source(config.data.data_file);
    MarketData prices(0, 0);
    try
    {
        prices = source.fetch_prices(config.data.universe, config.kelly.lookback_days);
    }
    catch (const DataError &e)
    {
        std::cerr << "Data error: " << e.what() << std::endl;
        return kExitFailure;
    }

    if (args.verbose)
    {
        prices.print_summary(std::cout);
        std::cout << "[2/3] Computing Kelly allocation..." << std::endl;
        std::cout << "  - Risk-free rate: " << config.kelly.risk_free_rate
                  << "\n  - Covariance: " << (config.kelly.diagonal_only ? "diagonal" : "full") << "\n";
    }

    calc::KellyParameters params;
    params.risk_free_rate = config.kelly.risk_free_rate;
    params.diagonal_only = config.kelly.diagonal_only;
    params.trading_days_per_year = config.kelly.trading_days_per_year;

    calc::KellyAnalysis analysis;
    try
    {
        calc::KellyAnalyzer analyzer(params);
        analysis = analyzer.analyze(prices);
    }
    catch (const calc::InvalidInput &e)
    {
        std::cerr << "Computation error (invalid input): " << e.what() << std::endl;
        return kExitFailure;
    }
    catch (const calc::SingularCovariance &e)
    {
        std::cerr << "Computation error (singular covariance): " << e.what() << std::endl;
        return kExitFailure;
    }
    catch (const calc::NumericInstability &e)
    {
        std::cerr << "Computation error (numeric instability): " << e.what() << std::endl;
        return kExitFailure;
    }

    if (args.verbose)
    {
        Eigen::JacobiSVD<Eigen::MatrixXd> svd(analysis.covariance);
        auto sv = svd.singularValues();
        std::cout << "  - Observations: " << analysis.num_observations << "\n";
        std::cout << "  - Covariance condition number: " << std::scientific
                  << std::setprecision(2) << sv(0) / sv(sv.size() - 1)
                  << std::defaultfloat << "\n";
        std::cout << "[3/3] Reporting..." << std::endl;
    }

    report::print_results(std::cout, analysis, config.kelly.full_kelly);
    report::print_warnings(std::cerr, analysis);

    return kExitSuccess;
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help)
    {
        print_usage(argv[0]);
        return kExitSuccess;
    }

    if (!args.error.empty())
    {
        std::cerr << "Error: " << args.error << "\n\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    try
    {
        return run(args);
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return kExitUsage;
    }
}
