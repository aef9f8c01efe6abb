// linear_probe_table.hpp
// String-keyed hash table with open addressing and linear probing. Entries are never removed.
//
// - C++17 header-only.
// - Default table size is the largest prime <= 2 * max_entries, so the load factor stays at or below 1/2
//   when the caller's estimate holds.
// - Probe statistics are collected on every probe sequence (lookups included):
//     conflict_count - probe sequences that met at least one occupied slot holding another key
//     probe_total    - occupied slots skipped, summed over all sequences
//     probe_max      - longest run of skipped slots in a single sequence

#ifndef OSTREE_LINEAR_PROBE_TABLE_HPP
#define OSTREE_LINEAR_PROBE_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ostree_errors.hpp"
#include "potion.hpp"
#include "primes.hpp"

enum class HashPolicy { good, bad };

struct ProbeStatistics {
    std::size_t conflict_count = 0;
    std::size_t probe_total = 0;
    std::size_t probe_max = 0;
};

template <typename T>
class LinearProbeTable {
public:
    using key_type    = std::string;
    using mapped_type = T;
    using size_type   = std::size_t;

    // tablesize_override == 0 selects the default prime size.
    explicit LinearProbeTable(size_type max_entries, HashPolicy policy = HashPolicy::good,
                              size_type tablesize_override = 0)
        : policy_(policy), count_(0)
    {
        size_type table_size = tablesize_override;
        if (table_size == 0) {
            if (max_entries == 0) throw std::invalid_argument("LinearProbeTable: max_entries must be positive");
            table_size = static_cast<size_type>(largest_prime(2 * static_cast<std::uint64_t>(max_entries) + 1));
        }
        if (table_size < 2) throw std::invalid_argument("LinearProbeTable: table size must be at least 2");
        table_.resize(table_size);
    }

    size_type size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }
    bool full() const noexcept { return count_ == table_.size(); }
    size_type table_size() const noexcept { return table_.size(); }

    const ProbeStatistics& statistics() const noexcept { return stats_; }

    // Inserts or overwrites. Throws table_full if key is new and no slot is free.
    template <typename V>
    void insert(const key_type& key, V&& value) {
        size_type pos = probe(key, true);
        if (!table_[pos]) {
            table_[pos].emplace(key, std::forward<V>(value));
            ++count_;
        } else {
            table_[pos]->second = std::forward<V>(value);
        }
    }

    mapped_type& at(const key_type& key) {
        return table_[probe(key, false)]->second;
    }

    const mapped_type& at(const key_type& key) const {
        return table_[probe(key, false)]->second;
    }

    bool contains(const key_type& key) const {
        return find_slot(key).has_value();
    }

private:
    HashPolicy policy_;
    std::vector<std::optional<std::pair<key_type, mapped_type>>> table_;
    size_type count_;
    mutable ProbeStatistics stats_;

    size_type hash(const key_type& key) const {
        return policy_ == HashPolicy::good ? Potion::good_hash(key, table_.size())
                                           : Potion::bad_hash(key, table_.size());
    }

    // Walks from the home slot to the slot holding key, or (for inserts) to the first empty slot.
    std::optional<size_type> find_slot(const key_type& key, bool for_insert = false) const {
        size_type pos = hash(key);
        size_type skipped = 0;
        for (size_type i = 0; i < table_.size(); ++i) {
            const auto& slot = table_[pos];
            if (!slot) {
                record(skipped);
                if (for_insert) return pos;
                return std::nullopt;
            }
            if (slot->first == key) {
                record(skipped);
                return pos;
            }
            ++skipped;
            ++stats_.probe_total;
            pos = (pos + 1) % table_.size();
        }
        record(skipped);
        return std::nullopt;
    }

    size_type probe(const key_type& key, bool for_insert) const {
        std::optional<size_type> pos = find_slot(key, for_insert);
        if (pos) return *pos;
        if (for_insert) throw table_full("LinearProbeTable::insert: table is full");
        throw key_not_found("LinearProbeTable::at: key not found: " + key);
    }

    void record(size_type skipped) const noexcept {
        if (skipped > 0) ++stats_.conflict_count;
        if (skipped > stats_.probe_max) stats_.probe_max = skipped;
    }
};

#endif // OSTREE_LINEAR_PROBE_TABLE_HPP
