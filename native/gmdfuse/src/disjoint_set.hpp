// disjoint_set.hpp — Union-find over a dense integer id space.
// Union by rank + path halving; near-constant amortized find/unite.
#pragma once
#include <cstdint>
#include <utility>
#include <vector>

class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n), rank_(n, 0) {
        for (size_t i = 0; i < n; ++i) parent_[i] = static_cast<uint32_t>(i);
    }

    uint32_t find(uint32_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    // Returns the root of the merged set.
    uint32_t unite(uint32_t a, uint32_t b) {
        a = find(a); b = find(b);
        if (a == b) return a;
        if (rank_[a] < rank_[b]) std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b]) ++rank_[a];
        return a;
    }

    size_t size() const { return parent_.size(); }

private:
    std::vector<uint32_t> parent_;
    std::vector<uint8_t> rank_;
};
