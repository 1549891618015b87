/**
 * @file cache_manager.cpp
 * @brief Implementation of CacheManager and the cached series format.
 */

#include "cache/cache_manager.hpp"
#include "adjustment/adjustment_classifier.hpp"
#include "data/calendar.hpp"

#include <cctype>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace fundscope
{
    namespace cache
    {

        namespace
        {

            /**
             * @brief First present key among @p names, or nullptr.
             */
            const nlohmann::json *find_field(const nlohmann::json &record,
                                             std::initializer_list<const char *> names)
            {
                for (const char *name : names)
                {
                    auto it = record.find(name);
                    if (it != record.end() && !it->is_null())
                    {
                        return &(*it);
                    }
                }
                return nullptr;
            }

            double number_or_zero(const nlohmann::json *value)
            {
                if (value == nullptr)
                {
                    return 0.0;
                }
                if (value->is_number())
                {
                    return value->get<double>();
                }
                if (value->is_string())
                {
                    return std::stod(value->get<std::string>());
                }
                throw std::invalid_argument("Expected a number, got: " + value->dump());
            }

            std::string record_date(const nlohmann::json &value)
            {
                // Older files store either ISO strings or epoch milliseconds
                if (value.is_number_integer())
                {
                    return data::date_from_epoch_seconds(value.get<int64_t>() / 1000);
                }
                std::string text = value.get<std::string>();
                if (text.size() < 10)
                {
                    throw std::invalid_argument("Malformed record date: '" + text + "'");
                }
                return text.substr(0, 10);
            }

        } // anonymous namespace

        // ===================================================================
        // Kinds
        // ===================================================================

        std::string to_string(CacheKind kind)
        {
            switch (kind)
            {
            case CacheKind::HISTORICAL:
                return "historical";
            case CacheKind::DESCRIPTION:
                return "description";
            case CacheKind::BENCHMARK:
                return "benchmark";
            case CacheKind::COMPOSITION:
                return "composition";
            }
            throw std::invalid_argument("Unknown cache kind");
        }

        CacheKind cache_kind_from_string(const std::string &name)
        {
            if (name == "historical")
                return CacheKind::HISTORICAL;
            if (name == "description")
                return CacheKind::DESCRIPTION;
            if (name == "benchmark")
                return CacheKind::BENCHMARK;
            if (name == "composition")
                return CacheKind::COMPOSITION;
            throw std::invalid_argument("Unknown cache kind: '" + name + "'");
        }

        std::chrono::seconds ttl_for(CacheKind kind)
        {
            using namespace std::chrono;
            if (kind == CacheKind::DESCRIPTION)
            {
                return hours(24 * 7);
            }
            return hours(24);
        }

        // ===================================================================
        // CacheEntry
        // ===================================================================

        nlohmann::json CacheEntry::to_json() const
        {
            nlohmann::json j;
            j["data"] = data;
            j["timestamp"] = data::format_timestamp(stored_at);
            j["source"] = source;
            if (validation)
            {
                j["validation"] = *validation;
            }
            return j;
        }

        CacheEntry CacheEntry::from_json(const nlohmann::json &j)
        {
            if (!j.is_object() || !j.contains("data") || !j.contains("timestamp"))
            {
                throw std::invalid_argument("Cache document lacks 'data' or 'timestamp'");
            }

            CacheEntry entry;
            entry.data = j.at("data");
            entry.stored_at = data::parse_timestamp(j.at("timestamp").get<std::string>());
            entry.source = j.value("source", std::string());
            if (j.contains("validation") && !j.at("validation").is_null())
            {
                entry.validation = j.at("validation");
            }
            return entry;
        }

        // ===================================================================
        // Series payloads
        // ===================================================================

        nlohmann::json series_to_json(const data::PriceSeries &series)
        {
            nlohmann::json records = nlohmann::json::array();
            for (const auto &rec : series.records())
            {
                records.push_back({{"date", rec.date},
                                   {"price", rec.price},
                                   {"dividend", rec.dividend},
                                   {"capital_gain", rec.capital_gain},
                                   {"is_adjusted", rec.is_adjusted}});
            }
            return records;
        }

        data::PriceSeries series_from_json(const nlohmann::json &payload, const std::string &source_name)
        {
            nlohmann::json records = payload.is_string()
                                         ? nlohmann::json::parse(payload.get<std::string>())
                                         : payload;
            if (!records.is_array())
            {
                throw std::invalid_argument("Cached series payload is not an array");
            }

            bool inferred_adjusted = adjustment::source_reports_adjusted_prices(source_name);

            std::vector<data::DailyRecord> out;
            out.reserve(records.size());
            bool any_adjusted = false;

            for (const auto &record : records)
            {
                const auto *date = find_field(record, {"date", "Date"});
                if (date == nullptr)
                {
                    throw std::invalid_argument("Cached record without a date");
                }
                const auto *price = find_field(record, {"price", "Price", "Close", "close"});
                if (price == nullptr)
                {
                    throw std::invalid_argument("Cached record without a price");
                }

                data::DailyRecord rec;
                rec.date = record_date(*date);
                rec.price = number_or_zero(price);
                rec.dividend = number_or_zero(find_field(record, {"dividend", "Dividends"}));
                rec.capital_gain = number_or_zero(find_field(record, {"capital_gain", "Capital Gains"}));

                const auto *flag = find_field(record, {"is_adjusted", "_is_adjusted"});
                rec.is_adjusted = flag != nullptr ? flag->get<bool>() : inferred_adjusted;
                any_adjusted = any_adjusted || rec.is_adjusted;
                out.push_back(rec);
            }

            if (any_adjusted)
            {
                for (auto &rec : out)
                {
                    rec.is_adjusted = true;
                    rec.dividend = 0.0;
                    rec.capital_gain = 0.0;
                }
            }

            return data::PriceSeries(std::move(out), source_name);
        }

        // ===================================================================
        // CacheManager
        // ===================================================================

        CacheManager::CacheManager(std::shared_ptr<CacheStore> store, Clock clock)
            : store_(std::move(store)), clock_(std::move(clock))
        {
            if (!store_)
            {
                throw std::invalid_argument("CacheManager requires a store");
            }
            if (!clock_)
            {
                clock_ = []
                { return std::chrono::system_clock::now(); };
            }
        }

        std::string CacheManager::make_key(const std::string &identifier, CacheKind kind)
        {
            std::string key;
            key.reserve(identifier.size());
            for (unsigned char c : identifier)
            {
                key.push_back(std::isalnum(c) || c == '.' || c == '-' || c == '_' ? static_cast<char>(c) : '_');
            }
            if (key.empty())
            {
                throw std::invalid_argument("Cache identifier cannot be empty");
            }
            return key + "_" + to_string(kind);
        }

        std::optional<CacheEntry> CacheManager::get(const std::string &identifier, CacheKind kind) const
        {
            std::string key = make_key(identifier, kind);

            try
            {
                auto contents = store_->read(key);
                if (!contents)
                {
                    return std::nullopt;
                }

                CacheEntry entry = CacheEntry::from_json(nlohmann::json::parse(*contents));
                if (clock_() - entry.stored_at > ttl_for(kind))
                {
                    return std::nullopt;
                }
                return entry;
            }
            catch (const std::exception &e)
            {
                std::cerr << "Warning: ignoring corrupt cache entry " << key << " in "
                          << store_->describe() << ": " << e.what() << std::endl;
                return std::nullopt;
            }
        }

        void CacheManager::put(const std::string &identifier, CacheKind kind, const nlohmann::json &data,
                               const std::string &source, const std::optional<nlohmann::json> &validation)
        {
            CacheEntry entry;
            entry.data = data;
            entry.stored_at = clock_();
            entry.source = source;
            entry.validation = validation;
            store_->write(make_key(identifier, kind), entry.to_json().dump(2));
        }

        void CacheManager::invalidate(const std::string &identifier, CacheKind kind)
        {
            store_->remove(make_key(identifier, kind));
        }

        std::optional<CachedSeries> CacheManager::get_series(const std::string &identifier, CacheKind kind) const
        {
            auto entry = get(identifier, kind);
            if (!entry)
            {
                return std::nullopt;
            }

            try
            {
                CachedSeries cached;
                cached.series = series_from_json(entry->data, entry->source);
                cached.series.set_fetched_at(data::format_timestamp(entry->stored_at));
                cached.source = entry->source;
                cached.stored_at = entry->stored_at;
                cached.validation = entry->validation;
                return cached;
            }
            catch (const std::exception &e)
            {
                std::cerr << "Warning: cached " << to_string(kind) << " series for " << identifier
                          << " is unreadable, refetching: " << e.what() << std::endl;
                return std::nullopt;
            }
        }

        void CacheManager::put_series(const std::string &identifier, CacheKind kind,
                                      const data::PriceSeries &series,
                                      const std::optional<nlohmann::json> &validation)
        {
            put(identifier, kind, series_to_json(series), series.source_name(), validation);
        }

        std::optional<std::string> CacheManager::get_description(const std::string &identifier) const
        {
            auto entry = get(identifier, CacheKind::DESCRIPTION);
            if (!entry)
            {
                return std::nullopt;
            }

            if (entry->data.is_string())
            {
                return entry->data.get<std::string>();
            }
            std::cerr << "Warning: cached description for " << identifier << " has an unexpected shape" << std::endl;
            return std::nullopt;
        }

        void CacheManager::put_description(const std::string &identifier, const std::string &text,
                                           const std::string &source)
        {
            put(identifier, CacheKind::DESCRIPTION, text, source);
        }

    } // namespace cache
} // namespace fundscope
