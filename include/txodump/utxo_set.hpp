#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include <boost/container_hash/hash.hpp>
#include <boost/unordered/unordered_flat_map.hpp>

#include <txodump/common_utxo.hpp>
#include <txodump/log.hpp>

namespace txodump {

struct utxo_entry {
    uint64_t value;
    uint32_t height;

    friend bool operator==(utxo_entry const&, utxo_entry const&) = default;
};

// In-memory UTXO set. Entries live until erased; there is no eviction.
// Hash is any 64-bit hasher over utxo_key_t.
template <typename Hash = boost::hash<utxo_key_t>>
class basic_utxo_set {
public:
    using hasher = Hash;
    using map_t = boost::unordered_flat_map<
        utxo_key_t,
        utxo_entry,
        Hash,
        std::equal_to<utxo_key_t>
    >;

    struct set_statistics {
        size_t total_inserts = 0;
        size_t overwrites = 0;          // insert on a key that was already present
        size_t total_erases = 0;
        size_t failed_erases = 0;
        size_t peak_entries = 0;
    };

    basic_utxo_set() = default;

    explicit
    basic_utxo_set(size_t expected_entries) {
        reserve(expected_entries);
    }

    // Last write wins. Returns false if an existing entry was overwritten.
    bool insert(utxo_key_t const& key, uint64_t value, uint32_t height) {
        auto const [it, inserted] = map_.insert_or_assign(key, utxo_entry{value, height});
        ++stats_.total_inserts;
        if ( ! inserted) {
            ++stats_.overwrites;
        }
        stats_.peak_entries = std::max(stats_.peak_entries, map_.size());
        return inserted;
    }

    std::optional<utxo_entry> find(utxo_key_t const& key) const {
        auto const it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(utxo_key_t const& key) const {
        return map_.find(key) != map_.end();
    }

    // Removes the entry if present and returns it.
    std::optional<utxo_entry> erase(utxo_key_t const& key) {
        auto const it = map_.find(key);
        if (it == map_.end()) {
            ++stats_.failed_erases;
            return std::nullopt;
        }
        utxo_entry const res = it->second;
        map_.erase(it);
        ++stats_.total_erases;
        return res;
    }

    void reserve(size_t n) {
        map_.reserve(n);
    }

    void clear() {
        map_.clear();
        stats_ = set_statistics{};
    }

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    set_statistics const& get_statistics() const { return stats_; }

    void print_statistics(logger& log) const {
        log.info("\n=== UTXO Set Statistics ===\n");
        log.info("Current entries: {}\n", map_.size());
        log.info("Peak entries:    {}\n", stats_.peak_entries);
        log.info("Total inserts:   {}\n", stats_.total_inserts);
        log.info("Overwrites:      {}\n", stats_.overwrites);
        log.info("Total erases:    {}\n", stats_.total_erases);
        log.info("Failed erases:   {}\n", stats_.failed_erases);
        log.info("Load factor:     {:.3f}\n", map_.load_factor());
        log.info("===========================\n");
    }

private:
    map_t map_;
    set_statistics stats_;
};

using utxo_set = basic_utxo_set<>;

} // namespace txodump
