/**
 * @file cache_store.cpp
 * @brief File and in-memory cache stores.
 */

#include "cache/cache_store.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fundscope
{
    namespace cache
    {

        // ===================================================================
        // FileCacheStore
        // ===================================================================

        FileCacheStore::FileCacheStore(fs::path directory)
            : directory_(std::move(directory))
        {
            std::error_code ec;
            fs::create_directories(directory_, ec);
            if (ec)
            {
                throw std::runtime_error("Could not create cache directory " + directory_.string() +
                                         ": " + ec.message());
            }
        }

        fs::path FileCacheStore::path_for(const std::string &key) const
        {
            return directory_ / (key + ".json");
        }

        std::optional<std::string> FileCacheStore::read(const std::string &key) const
        {
            fs::path path = path_for(key);
            if (!fs::exists(path))
            {
                return std::nullopt;
            }

            std::ifstream file(path);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open cache file: " + path.string());
            }

            std::ostringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

        void FileCacheStore::write(const std::string &key, const std::string &contents)
        {
            static std::atomic<unsigned long> counter{0};

            fs::path target = path_for(key);
            auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            fs::path temp = directory_ / (key + ".json.tmp" + std::to_string(stamp) + "_" +
                                          std::to_string(counter++));

            {
                std::ofstream file(temp, std::ios::trunc);
                if (!file.is_open())
                {
                    throw std::runtime_error("Could not open file for writing: " + temp.string());
                }
                file << contents;
                if (!file)
                {
                    throw std::runtime_error("Failed writing cache file: " + temp.string());
                }
            }

            std::error_code ec;
            fs::rename(temp, target, ec);
            if (ec)
            {
                fs::remove(temp, ec);
                throw std::runtime_error("Could not move cache file into place: " + target.string());
            }
        }

        void FileCacheStore::remove(const std::string &key)
        {
            std::error_code ec;
            fs::remove(path_for(key), ec);
            if (ec)
            {
                std::cerr << "Warning: could not remove cache file " << path_for(key).string()
                          << ": " << ec.message() << std::endl;
            }
        }

        std::string FileCacheStore::describe() const
        {
            return "directory " + directory_.string();
        }

        // ===================================================================
        // InMemoryCacheStore
        // ===================================================================

        std::optional<std::string> InMemoryCacheStore::read(const std::string &key) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = documents_.find(key);
            if (it == documents_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        void InMemoryCacheStore::write(const std::string &key, const std::string &contents)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            documents_[key] = contents;
        }

        void InMemoryCacheStore::remove(const std::string &key)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            documents_.erase(key);
        }

        size_t InMemoryCacheStore::size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return documents_.size();
        }

    } // namespace cache
} // namespace fundscope
