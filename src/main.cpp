/**
 * @file main.cpp
 * @brief Main entry point for fundscope
 *
 * Command-line application that loads configuration and an instrument list,
 * resolves and validates daily histories, and exports a base-100 comparison
 * table and per-instrument metrics.
 */

#include "cache/cache_manager.hpp"
#include "cache/cache_store.hpp"
#include "data/calendar.hpp"
#include "data/data_loader.hpp"
#include "data/identifier.hpp"
#include "pipeline/fund_pipeline.hpp"
#include "sources/composition_fetcher.hpp"
#include "sources/description_fetcher.hpp"
#include "sources/http_client.hpp"
#include "sources/rate_limiter.hpp"
#include "sources/source_resolver.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fundscope;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "fundscope v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (defaults if omitted)\n"
              << "  --isin ID             Analyze a single ISIN or ticker\n"
              << "  --isin-list PATH      Text file with one identifier per line\n"
              << "  --funds-file PATH     JSON file with an 'instruments' array\n"
              << "  --start-date DATE     Common comparison start (YYYY-MM-DD)\n"
              << "  --output PATH         Path to output directory (default: from config)\n"
              << "  --descriptions        Fetch instrument descriptions\n"
              << "  --composition         Fetch sector weights and top holdings\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --isin US87281Y1029\n"
              << "  " << program_name << " --config config.json --funds-file funds.json --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       fundscope v1.0.0                                        \n"
              << "       Fund and ETF total-return comparison                    \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string isin;
    std::string isin_list;
    std::string funds_file;
    std::string start_date;
    std::string output_dir;
    bool descriptions = false;
    bool composition = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--isin" && i + 1 < argc)
            {
                args.isin = argv[++i];
            }
            else if (arg == "--isin-list" && i + 1 < argc)
            {
                args.isin_list = argv[++i];
            }
            else if (arg == "--funds-file" && i + 1 < argc)
            {
                args.funds_file = argv[++i];
            }
            else if (arg == "--start-date" && i + 1 < argc)
            {
                args.start_date = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--descriptions")
            {
                args.descriptions = true;
            }
            else if (arg == "--composition")
            {
                args.composition = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && (!isin.empty() || !isin_list.empty() || !funds_file.empty());
    }
};

/**
 * @brief Print the metrics table
 */
void print_metrics(const pipeline::BatchResult &batch)
{
    auto fmt = [](const std::optional<double> &v, int precision)
    {
        std::ostringstream ss;
        if (v)
            ss << std::fixed << std::setprecision(precision) << *v;
        else
            ss << "n/a";
        return ss.str();
    };

    std::cout << "\n"
              << std::string(86, '-') << "\n";
    std::cout << std::left << std::setw(16) << "Instrument" << std::right
              << std::setw(12) << "Total %" << std::setw(12) << "Annual %"
              << std::setw(10) << "Vol %" << std::setw(10) << "Sharpe"
              << std::setw(12) << "MaxDD %" << std::setw(8) << "Beta" << "\n";
    std::cout << std::string(86, '-') << "\n";

    for (const auto &m : batch.metrics)
    {
        std::cout << std::left << std::setw(16) << m.instrument << std::right
                  << std::setw(12) << fmt(m.total_return, 2)
                  << std::setw(12) << fmt(m.annualized_return, 2)
                  << std::setw(10) << fmt(m.volatility, 2)
                  << std::setw(10) << fmt(m.sharpe_ratio, 2)
                  << std::setw(12) << fmt(m.max_drawdown, 2)
                  << std::setw(8) << fmt(m.beta, 2) << "\n";
    }
    std::cout << std::string(86, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        data::AnalysisConfig config;
        if (!args.config_path.empty())
        {
            config = data::DataLoader::load_config(args.config_path);
        }
        data::DataLoader::apply_environment(config);

        if (!args.start_date.empty())
        {
            if (!data::is_valid_date(args.start_date))
            {
                throw std::invalid_argument("Invalid --start-date: " + args.start_date);
            }
            config.common_start_date = args.start_date;
        }
        if (!args.output_dir.empty())
        {
            config.output_dir = args.output_dir;
        }

        data::DateRange range = config.analysis_range();
        if (args.verbose)
        {
            std::cout << "  - Horizon: " << range.start << " to " << range.end << "\n";
            std::cout << "  - Base value: " << config.base_value << "\n";
            std::cout << "  - Cache: " << config.cache_dir << "\n";
            if (config.common_start_date)
            {
                std::cout << "  - Common start override: " << *config.common_start_date << "\n";
            }
        }

        // ====================================================================
        // 2. Load Instruments
        // ====================================================================
        std::cout << "[2/5] Loading instruments..." << std::endl;

        std::vector<data::InstrumentSpec> instruments;
        if (!args.isin.empty())
        {
            data::InstrumentSpec spec;
            spec.identifier = data::normalize_identifier(args.isin);
            instruments.push_back(spec);
        }
        if (!args.isin_list.empty())
        {
            auto more = data::DataLoader::load_instruments(args.isin_list);
            instruments.insert(instruments.end(), more.begin(), more.end());
        }
        if (!args.funds_file.empty())
        {
            auto more = data::DataLoader::load_instruments(args.funds_file);
            instruments.insert(instruments.end(), more.begin(), more.end());
        }
        if (instruments.empty())
        {
            throw std::runtime_error("No valid instruments to analyze");
        }
        std::cout << "  - " << instruments.size() << " instrument(s)" << std::endl;

        // ====================================================================
        // 3. Set Up Sources
        // ====================================================================
        std::cout << "[3/5] Setting up data sources..." << std::endl;

        sources::CurlHttpClient http(config.http_timeout_seconds);
        sources::RateLimiter limiter(
            std::chrono::milliseconds(static_cast<long>(config.rate_limit_seconds * 1000.0)));

        adjustment::AdjustmentClassifier classifier(config.market, config.ex_distribution_threshold);
        auto resolver = std::make_shared<sources::SourceResolver>(
            sources::build_default_sources(config, http, limiter), classifier);

        auto cache_manager = std::make_shared<cache::CacheManager>(
            std::make_shared<cache::FileCacheStore>(config.cache_dir));

        std::shared_ptr<sources::DescriptionFetcher> descriptions;
        if (args.descriptions)
        {
            descriptions = std::make_shared<sources::DescriptionFetcher>(http, limiter, *cache_manager);
        }

        std::shared_ptr<sources::CompositionFetcher> compositions;
        if (args.composition)
        {
            compositions = std::make_shared<sources::CompositionFetcher>(http, limiter, *cache_manager);
        }

        if (args.verbose)
        {
            std::cout << "  - Source order:\n";
            for (const auto &name : resolver->active_source_names())
            {
                std::cout << "      " << name << "\n";
            }
        }

        // ====================================================================
        // 4. Fetch, Validate and Compare
        // ====================================================================
        std::cout << "[4/5] Fetching and validating histories..." << std::endl;

        pipeline::FundPipeline fund_pipeline(config, resolver, cache_manager, descriptions, compositions);
        fund_pipeline.set_verbose(args.verbose);
        auto batch = fund_pipeline.run(instruments);

        if (batch.table.empty())
        {
            std::cerr << "\nError: no instrument could be analyzed" << std::endl;
            return 1;
        }
        print_metrics(batch);

        // ====================================================================
        // 5. Export
        // ====================================================================
        std::cout << "\n[5/5] Exporting results..." << std::endl;

        std::filesystem::create_directories(config.output_dir);
        std::string table_file = config.output_dir + "/comparison_table.csv";
        std::string metrics_file = config.output_dir + "/metrics.json";
        batch.table.to_csv(table_file);
        batch.export_metrics_json(metrics_file);
        std::cout << "  - " << table_file << "\n"
                  << "  - " << metrics_file << std::endl;

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed in " << duration << " ms ("
                  << batch.succeeded() << " of " << batch.instruments.size() << " instruments)\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
