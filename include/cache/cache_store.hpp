/**
 * @file cache_store.hpp
 * @brief Key-value backing stores for the cache manager.
 *
 * The cache manager only needs to read, write and remove whole documents by
 * key. Keeping that behind CacheStore lets the filesystem be swapped for
 * another store without touching TTL or serialization logic.
 */

#ifndef FUNDSCOPE_CACHE_CACHE_STORE_HPP
#define FUNDSCOPE_CACHE_CACHE_STORE_HPP

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fundscope
{
    namespace cache
    {

        /**
         * @class CacheStore
         * @brief Abstract document store keyed by string.
         */
        class CacheStore
        {
        public:
            virtual ~CacheStore() = default;

            /**
             * @brief Read the document stored under @p key.
             * @return Contents, or std::nullopt if nothing is stored.
             * @throws std::runtime_error if the document exists but cannot be read.
             */
            virtual std::optional<std::string> read(const std::string &key) const = 0;

            /**
             * @brief Store @p contents under @p key, replacing any previous document.
             * @throws std::runtime_error on I/O failure.
             */
            virtual void write(const std::string &key, const std::string &contents) = 0;

            /** @brief Remove the document under @p key, if any. */
            virtual void remove(const std::string &key) = 0;

            /** @brief Short store description for log messages. */
            virtual std::string describe() const = 0;
        };

        /**
         * @class FileCacheStore
         * @brief One JSON file per key inside a directory.
         *
         * Writes go to a temporary file in the same directory and are renamed
         * into place, so concurrent readers see either the old or the new
         * document and the last writer wins.
         */
        class FileCacheStore : public CacheStore
        {
        public:
            /**
             * @brief Constructor. Creates @p directory if needed.
             * @throws std::runtime_error if the directory cannot be created.
             */
            explicit FileCacheStore(std::filesystem::path directory);

            std::optional<std::string> read(const std::string &key) const override;
            void write(const std::string &key, const std::string &contents) override;
            void remove(const std::string &key) override;
            std::string describe() const override;

            /** @brief Path of the file holding @p key. */
            std::filesystem::path path_for(const std::string &key) const;

            const std::filesystem::path &directory() const { return directory_; }

        private:
            std::filesystem::path directory_;
        };

        /**
         * @class InMemoryCacheStore
         * @brief Map-backed store for tests and single-run use.
         */
        class InMemoryCacheStore : public CacheStore
        {
        public:
            std::optional<std::string> read(const std::string &key) const override;
            void write(const std::string &key, const std::string &contents) override;
            void remove(const std::string &key) override;
            std::string describe() const override { return "in-memory store"; }

            size_t size() const;

        private:
            mutable std::mutex mutex_;
            std::map<std::string, std::string> documents_;
        };

    } // namespace cache
} // namespace fundscope

#endif // FUNDSCOPE_CACHE_CACHE_STORE_HPP
