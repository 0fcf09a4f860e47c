/**
 * @file generate_synthetic_prices.cpp
 * @brief Generate a synthetic price history CSV for the Kelly allocator
 */

#include "calc/returns.hpp"
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "risk/sample_covariance.hpp"
#include <cmath>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <string>

using namespace kelly;

int main(int argc, char* argv[]) {
    std::vector<std::string> tickers = {"AAPL", "MSFT", "JPM", "XOM", "GLD"};

    // One year of daily closes
    size_t num_days = 252;
    std::string start_date = "2024-01-02";
    std::string output_file = "data/market/historical_prices.csv";
    double volatility = 0.015;  // 1.5% daily volatility
    double drift = 0.0004;      // ~10% annualized return
    std::uint32_t seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--days" && i + 1 < argc) {
                num_days = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--start" && i + 1 < argc) {
                start_date = argv[++i];
            } else if (arg == "--volatility" && i + 1 < argc) {
                volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                drift = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/historical_prices.csv)\n"
                          << "  --days N           Number of daily rows (default: 252)\n"
                          << "  --start DATE       First date, YYYY-MM-DD (default: 2024-01-02)\n"
                          << "  --volatility VAL   Daily volatility (default: 0.015)\n"
                          << "  --drift VAL        Daily drift (default: 0.0004)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            } else {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        std::cout << "\n=== Synthetic Price Generator ===\n" << std::endl;
        std::cout << "Assets: " << tickers.size() << ", days: " << num_days
                  << ", seed: " << seed << std::endl;

        auto data = DataLoader::generate_synthetic_data(
            tickers, num_days, start_date, volatility, drift, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        const auto parent = std::filesystem::path(output_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        DataLoader::save_csv_wide(data, output_file);

        data.print_summary(std::cout);

        if (num_days < 3) {
            return 0;
        }

        auto returns = calc::compute_returns(data.get_Prices());
        Eigen::VectorXd ann_mean = returns.colwise().mean().transpose() * calc::kTradingDaysPerYear;
        risk::SampleCovariance estimator(true, calc::kTradingDaysPerYear);
        Eigen::MatrixXd ann_cov = estimator.estimate_covariance(returns);

        std::cout << "Asset Statistics (Annualized):\n";
        std::cout << std::string(45, '-') << "\n";
        std::cout << std::setw(8) << "Ticker"
                  << std::setw(18) << "Mean Return"
                  << std::setw(18) << "Volatility" << "\n";
        std::cout << std::string(45, '-') << "\n";

        for (size_t i = 0; i < data.num_assets(); ++i) {
            const Eigen::Index k = static_cast<Eigen::Index>(i);
            std::cout << std::setw(8) << data.get_tickers()[i]
                      << std::setw(17) << std::fixed << std::setprecision(2)
                      << ann_mean(k) * 100 << "%"
                      << std::setw(17) << std::sqrt(ann_cov(k, k)) * 100 << "%\n";
        }
        std::cout << std::string(45, '-') << "\n";

        std::cout << "\nYou can now run:\n";
        std::cout << "  ./build/kelly_allocator --data " << output_file << " --lookback 365";
        for (const auto& ticker : tickers) {
            std::cout << " " << ticker;
        }
        std::cout << "\n" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
