#pragma once

#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "covertrax/aoi.hpp"
#include "covertrax/imagery.hpp"
#include "covertrax/raster.hpp"

namespace covertrax {

    /**
     * @brief Thread-safe composite cache with a freshness window
     *
     * Entries are keyed by fingerprint() of everything that determines a
     * composite. An entry older than the freshness window is never returned;
     * it is evicted on the lookup that finds it stale.
     */
    class CompositeCache {
      public:
        using Clock = std::chrono::steady_clock;

        explicit CompositeCache(std::chrono::seconds freshness, std::size_t capacity = 16,
                                std::function<Clock::time_point()> clock = [] { return Clock::now(); })
            : freshness_(freshness), capacity_(capacity), clock_(std::move(clock)) {}

        std::optional<RasterComposite> find(const std::string &key) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                return std::nullopt;
            }
            if (clock_() - it->second.stored_at > freshness_) {
                entries_.erase(it);
                return std::nullopt;
            }
            return it->second.composite;
        }

        void store(const std::string &key, const RasterComposite &composite) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = clock_();
            if (entries_.size() >= capacity_ && entries_.find(key) == entries_.end()) {
                evict_oldest();
            }
            entries_[key] = Entry{composite, now};
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

        /**
         * @brief Deterministic key of (geometry, grid, date range, cloud threshold, QA bits)
         *
         * FNV-1a over the exact bit patterns of the inputs.
         */
        static std::string fingerprint(const AoiGeometry &aoi, const GridSpec &grid, const DateRange &range,
                                       double max_cloud_fraction, std::uint16_t qa_mask_bits) {
            std::uint64_t h = 1469598103934665603ULL;
            auto mix_bytes = [&h](const void *data, std::size_t len) {
                const auto *bytes = static_cast<const unsigned char *>(data);
                for (std::size_t i = 0; i < len; ++i) {
                    h ^= bytes[i];
                    h *= 1099511628211ULL;
                }
            };
            auto mix_double = [&](double v) {
                std::uint64_t bits = 0;
                std::memcpy(&bits, &v, sizeof(bits));
                mix_bytes(&bits, sizeof(bits));
            };
            auto mix_u64 = [&](std::uint64_t v) { mix_bytes(&v, sizeof(v)); };

            for (const auto &p : aoi.polygon.vertices) {
                mix_double(p.x);
                mix_double(p.y);
            }
            mix_double(grid.west);
            mix_double(grid.north);
            mix_double(grid.cell_lon);
            mix_double(grid.cell_lat);
            mix_u64(grid.rows);
            mix_u64(grid.cols);
            mix_u64(static_cast<std::uint64_t>(range.start.time_since_epoch().count()));
            mix_u64(static_cast<std::uint64_t>(range.end.time_since_epoch().count()));
            mix_double(max_cloud_fraction);
            mix_u64(qa_mask_bits);

            std::ostringstream oss;
            oss << std::hex << std::setw(16) << std::setfill('0') << h;
            return oss.str();
        }

      private:
        struct Entry {
            RasterComposite composite;
            Clock::time_point stored_at;
        };

        void evict_oldest() {
            auto oldest = entries_.end();
            for (auto it = entries_.begin(); it != entries_.end(); ++it) {
                if (oldest == entries_.end() || it->second.stored_at < oldest->second.stored_at) {
                    oldest = it;
                }
            }
            if (oldest != entries_.end()) {
                entries_.erase(oldest);
            }
        }

        std::chrono::seconds freshness_;
        std::size_t capacity_;
        std::function<Clock::time_point()> clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace covertrax
