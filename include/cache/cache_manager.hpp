/**
 * @file cache_manager.hpp
 * @brief TTL-aware cache of fetched series and descriptions.
 *
 * One document per (identifier, kind) pair:
 * @code
 *   { "data": ..., "timestamp": "2024-05-01T08:30:00Z",
 *     "source": "Yahoo Finance", "validation": { ... } }
 * @endcode
 * Entries older than their kind's TTL, and entries that fail to parse, are
 * reported as misses. The manager never throws on a corrupt entry.
 */

#ifndef FUNDSCOPE_CACHE_CACHE_MANAGER_HPP
#define FUNDSCOPE_CACHE_CACHE_MANAGER_HPP

#include "cache/cache_store.hpp"
#include "data/price_series.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace fundscope
{
    namespace cache
    {

        /**
         * @enum CacheKind
         * @brief Category of cached payload; each has its own TTL.
         */
        enum class CacheKind
        {
            HISTORICAL,  ///< Instrument price history (24 hours)
            DESCRIPTION, ///< Instrument description text (7 days)
            BENCHMARK,   ///< Benchmark price history (24 hours)
            COMPOSITION  ///< Holdings / composition data (24 hours)
        };

        /** @brief Lower-case kind name used in keys ("historical", ...). */
        std::string to_string(CacheKind kind);

        /**
         * @brief Parse a kind name.
         * @throws std::invalid_argument for an unknown name.
         */
        CacheKind cache_kind_from_string(const std::string &name);

        /** @brief Time-to-live of a kind. */
        std::chrono::seconds ttl_for(CacheKind kind);

        /**
         * @struct CacheEntry
         * @brief One stored document.
         */
        struct CacheEntry
        {
            nlohmann::json data;                                ///< Payload
            std::chrono::system_clock::time_point stored_at;    ///< Write time
            std::string source;                                 ///< Originating source name
            std::optional<nlohmann::json> validation;           ///< Validation report, if any

            nlohmann::json to_json() const;

            /**
             * @brief Parse a stored document.
             * @throws std::exception subclasses on a malformed document.
             */
            static CacheEntry from_json(const nlohmann::json &j);
        };

        /**
         * @struct CachedSeries
         * @brief Series read back from the cache with its metadata.
         */
        struct CachedSeries
        {
            data::PriceSeries series;
            std::string source;
            std::chrono::system_clock::time_point stored_at;
            std::optional<nlohmann::json> validation;
        };

        /**
         * @brief Serialize a series as the cache "data" array.
         */
        nlohmann::json series_to_json(const data::PriceSeries &series);

        /**
         * @brief Rebuild a series from a cache "data" payload.
         *
         * Accepts the current field names and the older
         * Date / Price / Dividends / Capital Gains / _is_adjusted columns, and a
         * payload stored as a JSON-encoded string. Missing distributions read
         * as 0. A missing adjustment flag is inferred from @p source_name.
         * An adjusted record's distributions are dropped.
         *
         * @throws std::invalid_argument if a record has no date or price.
         */
        data::PriceSeries series_from_json(const nlohmann::json &payload, const std::string &source_name);

        /**
         * @class CacheManager
         * @brief Reads and writes cache entries through a CacheStore.
         *
         * Usage:
         * @code
         *   CacheManager cache(std::make_shared<FileCacheStore>("cache"));
         *   if (auto hit = cache.get_series("IE00B4L5Y983", CacheKind::HISTORICAL)) { ... }
         * @endcode
         */
        class CacheManager
        {
        public:
            using Clock = std::function<std::chrono::system_clock::time_point()>;

            /**
             * @brief Constructor.
             * @param store Backing store (must not be null).
             * @param clock Time source; defaults to the system clock.
             * @throws std::invalid_argument if @p store is null.
             */
            explicit CacheManager(std::shared_ptr<CacheStore> store, Clock clock = nullptr);

            // ---------------------------------------------------------------
            // Generic entries
            // ---------------------------------------------------------------

            /**
             * @brief Fresh entry for (identifier, kind), or std::nullopt.
             *
             * Stale, missing and unreadable entries are all misses.
             */
            std::optional<CacheEntry> get(const std::string &identifier, CacheKind kind) const;

            /**
             * @brief Store a payload stamped with the current time.
             * @throws std::runtime_error if the store fails to write.
             */
            void put(const std::string &identifier, CacheKind kind, const nlohmann::json &data,
                     const std::string &source,
                     const std::optional<nlohmann::json> &validation = std::nullopt);

            /** @brief Drop the entry for (identifier, kind). */
            void invalidate(const std::string &identifier, CacheKind kind);

            // ---------------------------------------------------------------
            // Typed helpers
            // ---------------------------------------------------------------

            /**
             * @brief Cached series for a HISTORICAL or BENCHMARK entry.
             *
             * An entry whose payload cannot be turned into a series is a miss.
             */
            std::optional<CachedSeries> get_series(const std::string &identifier, CacheKind kind) const;

            /**
             * @brief Store a series, tagged with series.source_name().
             */
            void put_series(const std::string &identifier, CacheKind kind, const data::PriceSeries &series,
                            const std::optional<nlohmann::json> &validation = std::nullopt);

            /** @brief Cached description text, or std::nullopt. */
            std::optional<std::string> get_description(const std::string &identifier) const;

            /** @brief Store a description. */
            void put_description(const std::string &identifier, const std::string &text, const std::string &source);

            /**
             * @brief Store key for (identifier, kind): "<identifier>_<kind>".
             *
             * Characters outside [A-Za-z0-9._-] are replaced by '_'.
             */
            static std::string make_key(const std::string &identifier, CacheKind kind);

            /** @brief Current time according to the injected clock. */
            std::chrono::system_clock::time_point now() const { return clock_(); }

        private:
            std::shared_ptr<CacheStore> store_;
            Clock clock_;
        };

    } // namespace cache
} // namespace fundscope

#endif // FUNDSCOPE_CACHE_CACHE_MANAGER_HPP
