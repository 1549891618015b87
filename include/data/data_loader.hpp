/**
 * @file data_loader.hpp
 * @brief Configuration, instrument lists and synthetic series.
 *
 * Provides the single AnalysisConfig built at startup, readers for the
 * instrument list formats and a deterministic synthetic series generator
 * for tests and demos.
 */

#ifndef FUNDSCOPE_DATA_DATA_LOADER_HPP
#define FUNDSCOPE_DATA_DATA_LOADER_HPP

#include "adjustment/adjustment_classifier.hpp"
#include "data/calendar.hpp"
#include "data/price_series.hpp"
#include "validation/data_validator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fundscope
{
    namespace data
    {

        /**
         * @struct AnalysisConfig
         * @brief Complete run configuration.
         *
         * JSON layout:
         * @code
         * {
         *   "analysis":   { "years_back": 5, "base_value": 100.0, "common_start_date": "2021-03-15",
         *                   "end_date": "2024-12-31", "trading_days_per_year": 252, "risk_free_rate": 0.0 },
         *   "cache":      { "directory": "cache" },
         *   "output":     { "directory": "output" },
         *   "sources":    { "rate_limit_seconds": 1.0, "http_timeout_seconds": 15,
         *                   "eod_api_key": "...", "fmp_api_key": "...", "alpha_vantage_api_key": "...",
         *                   "exchange_suffixes": ["L", "PA", ...] },
         *   "market":     { "home_country": "US", "fund_ticker_length": 5, "fund_ticker_suffix": "X" },
         *   "adjustment": { "ex_distribution_threshold": -0.01 },
         *   "validation": { "max_daily_change": 0.20, "suspicious_daily_change": 0.10, "max_gap_days": 5 }
         * }
         * @endcode
         */
        struct AnalysisConfig
        {
            int years_back = 5;                              ///< Analysis horizon in years
            double base_value = 100.0;                       ///< Value of every instrument at the common start
            std::optional<std::string> common_start_date;    ///< Explicit comparison start
            std::optional<std::string> end_date;             ///< Last date of the horizon (default: today)
            int trading_days_per_year = 252;
            double risk_free_rate = 0.0;                     ///< Annual, as a fraction

            std::string cache_dir = "cache";
            std::string output_dir = "output";

            double rate_limit_seconds = 1.0;                 ///< Spacing between calls to one provider
            long http_timeout_seconds = 15;
            std::optional<std::string> eod_api_key;
            std::optional<std::string> fmp_api_key;
            std::optional<std::string> alpha_vantage_api_key;
            std::vector<std::string> exchange_suffixes = {"L", "PA", "DE", "MI", "AS", "SW",
                                                          "BR", "VI", "IR", "LN", "LS"};

            adjustment::MarketConvention market;
            double ex_distribution_threshold = -0.01;        ///< Price change below which a distribution day is ex-date
            validation::ValidationThresholds validation;

            /**
             * @brief Load from JSON object; absent keys keep their defaults.
             * @throws std::invalid_argument on out-of-range values.
             */
            static AnalysisConfig from_json(const nlohmann::json &j);

            /** @brief Trailing window of years_back years ending at end_date (or today). */
            DateRange analysis_range() const;
        };

        /**
         * @struct InstrumentSpec
         * @brief One entry of an instrument list.
         */
        struct InstrumentSpec
        {
            std::string identifier;                ///< ISIN or ticker, normalized
            std::optional<std::string> ticker;     ///< Provider symbol, if known
            std::optional<std::string> name_short; ///< Display name
        };

        /**
         * @struct SyntheticSeriesSpec
         * @brief Parameters of a generated daily series.
         */
        struct SyntheticSeriesSpec
        {
            std::string start_date = "2022-01-03";
            size_t num_days = 504;                 ///< Number of business-day observations
            double start_price = 100.0;
            double annual_drift = 0.08;            ///< Compounded over trading_days_per_year
            double daily_volatility = 0.0;         ///< Std-dev of the daily noise term
            unsigned int seed = 42;
            double distribution_yield = 0.0;       ///< Distribution as a fraction of the pre-ex price
            size_t distribution_interval = 63;     ///< Observations between distributions
            double ex_date_move = 0.0;             ///< Market move on distribution days
            bool is_adjusted = false;              ///< Adjusted series carry no distribution fields
            int trading_days_per_year = 252;
        };

        /**
         * @class DataLoader
         * @brief Loads configuration, instrument lists and series files.
         */
        class DataLoader
        {
        public:
            DataLoader() = default;
            ~DataLoader() = default;

            // ========================================================================
            // Configuration Loading
            // ========================================================================

            /**
             * @brief Load JSON file.
             * @throws std::runtime_error if the file cannot be opened or parsed.
             */
            static nlohmann::json load_json(const std::string &filepath);

            /**
             * @brief Load the run configuration from a JSON file.
             */
            static AnalysisConfig load_config(const std::string &config_path);

            /**
             * @brief Fill unset API keys from EOD_API_KEY, FMP_API_KEY and ALPHA_VANTAGE_API_KEY.
             */
            static void apply_environment(AnalysisConfig &config);

            // ========================================================================
            // Instrument Lists
            // ========================================================================

            /**
             * @brief Load instruments from a JSON file or a plain identifier list.
             *
             * JSON: { "instruments": [ { "identifier" | "isin": ..., "ticker": ..., "name_short": ... } ] }
             * or a bare array of such objects. Text: one identifier per line,
             * optionally followed by ",ticker,name"; blank lines and '#' comments
             * are skipped. Entries that are neither ISIN- nor ticker-shaped are
             * skipped with a warning.
             *
             * @throws std::runtime_error if the file cannot be opened.
             */
            static std::vector<InstrumentSpec> load_instruments(const std::string &filepath);

            /** @brief Parse instrument entries from a JSON document. */
            static std::vector<InstrumentSpec> instruments_from_json(const nlohmann::json &j);

            // ========================================================================
            // Data Generation (for testing)
            // ========================================================================

            /**
             * @brief Generate a reproducible daily series on business days.
             *
             * Each day the price grows by the daily drift times (1 + noise). On
             * distribution days the price additionally moves by ex_date_move and
             * then falls by the distribution. Adjusted series keep the pre-drop
             * path and carry no distributions.
             */
            static PriceSeries generate_synthetic_series(const SyntheticSeriesSpec &spec);

        private:
            static std::vector<std::string> parse_csv_line(const std::string &line);
            static std::string trim(const std::string &str);
        };

    } // namespace data
} // namespace fundscope

#endif // FUNDSCOPE_DATA_DATA_LOADER_HPP
