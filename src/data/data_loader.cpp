/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and AnalysisConfig
 */

#include "data/data_loader.hpp"
#include "data/identifier.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fundscope
{
    namespace data
    {

        namespace
        {

            std::optional<std::string> optional_string(const nlohmann::json &j, const char *key)
            {
                if (!j.contains(key) || j.at(key).is_null())
                {
                    return std::nullopt;
                }
                std::string value = j.at(key).get<std::string>();
                if (value.empty())
                {
                    return std::nullopt;
                }
                return value;
            }

            std::optional<std::string> env_value(const char *name)
            {
                const char *value = std::getenv(name);
                if (value == nullptr || *value == '\0')
                {
                    return std::nullopt;
                }
                return std::string(value);
            }

            bool is_weekend(const std::string &date)
            {
                int wd = weekday(date);
                return wd == 0 || wd == 6;
            }

        } // anonymous namespace

        // =============================================
        // AnalysisConfig
        // =============================================

        AnalysisConfig AnalysisConfig::from_json(const nlohmann::json &j)
        {
            AnalysisConfig config;

            if (j.contains("analysis"))
            {
                const auto &analysis = j["analysis"];
                config.years_back = analysis.value("years_back", 5);
                config.base_value = analysis.value("base_value", 100.0);
                config.common_start_date = optional_string(analysis, "common_start_date");
                config.end_date = optional_string(analysis, "end_date");
                config.trading_days_per_year = analysis.value("trading_days_per_year", 252);
                config.risk_free_rate = analysis.value("risk_free_rate", 0.0);
            }

            if (j.contains("cache"))
            {
                config.cache_dir = j["cache"].value("directory", std::string("cache"));
            }
            if (j.contains("output"))
            {
                config.output_dir = j["output"].value("directory", std::string("output"));
            }

            if (j.contains("sources"))
            {
                const auto &sources = j["sources"];
                config.rate_limit_seconds = sources.value("rate_limit_seconds", 1.0);
                config.http_timeout_seconds = sources.value("http_timeout_seconds", 15L);
                config.eod_api_key = optional_string(sources, "eod_api_key");
                config.fmp_api_key = optional_string(sources, "fmp_api_key");
                config.alpha_vantage_api_key = optional_string(sources, "alpha_vantage_api_key");
                if (sources.contains("exchange_suffixes"))
                {
                    config.exchange_suffixes = sources["exchange_suffixes"].get<std::vector<std::string>>();
                }
            }

            if (j.contains("market"))
            {
                config.market = adjustment::MarketConvention::from_json(j["market"]);
            }
            if (j.contains("adjustment"))
            {
                config.ex_distribution_threshold = j["adjustment"].value("ex_distribution_threshold", -0.01);
            }
            if (j.contains("validation"))
            {
                config.validation = validation::ValidationThresholds::from_json(j["validation"]);
            }

            if (config.years_back <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'years_back', got: " + std::to_string(config.years_back));
            }
            if (config.base_value <= 0.0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'base_value', got: " + std::to_string(config.base_value));
            }
            if (config.trading_days_per_year <= 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'trading_days_per_year', got: " +
                                            std::to_string(config.trading_days_per_year));
            }
            if (config.rate_limit_seconds < 0.0)
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'rate_limit_seconds', got: " +
                                            std::to_string(config.rate_limit_seconds));
            }
            if (config.http_timeout_seconds <= 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'http_timeout_seconds', got: " +
                                            std::to_string(config.http_timeout_seconds));
            }
            if (config.ex_distribution_threshold <= -1.0 || config.ex_distribution_threshold > 0.0)
            {
                throw std::invalid_argument("Expected value in (-1, 0] for parameter 'ex_distribution_threshold', got: " +
                                            std::to_string(config.ex_distribution_threshold));
            }
            if (config.common_start_date && !is_valid_date(*config.common_start_date))
            {
                throw std::invalid_argument("Invalid common_start_date: " + *config.common_start_date);
            }
            if (config.end_date && !is_valid_date(*config.end_date))
            {
                throw std::invalid_argument("Invalid end_date: " + *config.end_date);
            }

            return config;
        }

        DateRange AnalysisConfig::analysis_range() const
        {
            return DateRange::trailing_years(end_date ? *end_date : today(), years_back);
        }

        // ===========================
        // Configuration Loading
        // ===========================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            return j;
        }

        AnalysisConfig DataLoader::load_config(const std::string &config_path)
        {
            return AnalysisConfig::from_json(load_json(config_path));
        }

        void DataLoader::apply_environment(AnalysisConfig &config)
        {
            if (!config.eod_api_key)
            {
                config.eod_api_key = env_value("EOD_API_KEY");
            }
            if (!config.fmp_api_key)
            {
                config.fmp_api_key = env_value("FMP_API_KEY");
            }
            if (!config.alpha_vantage_api_key)
            {
                config.alpha_vantage_api_key = env_value("ALPHA_VANTAGE_API_KEY");
            }
        }

        // ===========================
        // Instrument Lists
        // ===========================

        std::vector<InstrumentSpec> DataLoader::instruments_from_json(const nlohmann::json &j)
        {
            const nlohmann::json &entries = j.is_array() ? j : j.at("instruments");
            if (!entries.is_array())
            {
                throw std::runtime_error("'instruments' must be an array");
            }

            std::vector<InstrumentSpec> out;
            for (const auto &entry : entries)
            {
                InstrumentSpec spec;
                if (entry.is_string())
                {
                    spec.identifier = normalize_identifier(entry.get<std::string>());
                }
                else
                {
                    auto id = optional_string(entry, "identifier");
                    if (!id)
                    {
                        id = optional_string(entry, "isin");
                    }
                    spec.identifier = id ? normalize_identifier(*id) : std::string();
                    spec.ticker = optional_string(entry, "ticker");
                    spec.name_short = optional_string(entry, "name_short");
                }

                if (InstrumentId::parse(spec.identifier).kind == IdentifierKind::UNKNOWN)
                {
                    std::cerr << "Warning: skipping unrecognized identifier '" << spec.identifier << "'" << std::endl;
                    continue;
                }
                out.push_back(std::move(spec));
            }
            return out;
        }

        std::vector<InstrumentSpec> DataLoader::load_instruments(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open instrument list: " + filepath);
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            std::string content = buffer.str();

            std::string head = trim(content);
            if (!head.empty() && (head[0] == '{' || head[0] == '['))
            {
                nlohmann::json j;
                try
                {
                    j = nlohmann::json::parse(content);
                }
                catch (const nlohmann::json::exception &e)
                {
                    throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
                }
                return instruments_from_json(j);
            }

            std::vector<InstrumentSpec> out;
            std::istringstream lines(content);
            std::string line;
            while (std::getline(lines, line))
            {
                line = trim(line);
                if (line.empty() || line[0] == '#')
                    continue;

                auto fields = parse_csv_line(line);
                InstrumentSpec spec;
                spec.identifier = normalize_identifier(fields[0]);
                if (fields.size() > 1 && !trim(fields[1]).empty())
                {
                    spec.ticker = normalize_identifier(fields[1]);
                }
                if (fields.size() > 2 && !trim(fields[2]).empty())
                {
                    spec.name_short = trim(fields[2]);
                }

                if (InstrumentId::parse(spec.identifier).kind == IdentifierKind::UNKNOWN)
                {
                    std::cerr << "Warning: skipping unrecognized identifier '" << spec.identifier << "'" << std::endl;
                    continue;
                }
                out.push_back(std::move(spec));
            }
            return out;
        }

        // ===========================
        // Data Generation
        // ===========================

        PriceSeries DataLoader::generate_synthetic_series(const SyntheticSeriesSpec &spec)
        {
            if (spec.start_price <= 0.0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'start_price', got: " + std::to_string(spec.start_price));
            }
            if (spec.distribution_yield < 0.0 || spec.distribution_yield >= 1.0)
            {
                throw std::invalid_argument("Expected value in [0, 1) for parameter 'distribution_yield', got: " +
                                            std::to_string(spec.distribution_yield));
            }

            std::mt19937 gen(spec.seed);
            std::normal_distribution<double> noise(0.0, 1.0);
            double daily_growth = std::pow(1.0 + spec.annual_drift, 1.0 / spec.trading_days_per_year);

            std::vector<DailyRecord> records;
            records.reserve(spec.num_days);

            std::string date = spec.start_date;
            while (is_weekend(date))
            {
                date = add_days(date, 1);
            }

            double price = spec.start_price;
            for (size_t i = 0; i < spec.num_days; ++i)
            {
                DailyRecord record;
                record.date = date;
                record.is_adjusted = spec.is_adjusted;

                if (i > 0)
                {
                    double shock = spec.daily_volatility > 0.0 ? spec.daily_volatility * noise(gen) : 0.0;
                    price *= daily_growth * (1.0 + shock);

                    bool distribution_day = spec.distribution_yield > 0.0 && spec.distribution_interval > 0 &&
                                            i % spec.distribution_interval == 0;
                    if (distribution_day)
                    {
                        price *= 1.0 + spec.ex_date_move;
                        if (!spec.is_adjusted)
                        {
                            record.dividend = price * spec.distribution_yield;
                            price -= record.dividend;
                        }
                    }
                }
                record.price = price;
                records.push_back(record);

                do
                {
                    date = add_days(date, 1);
                } while (is_weekend(date));
            }

            return PriceSeries(std::move(records), "synthetic");
        }

        // ===========================
        // Private Helper Methods
        // ===========================

        std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

    } // namespace data
} // namespace fundscope
