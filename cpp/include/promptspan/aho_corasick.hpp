#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptspan {

/**
 * Aho-Corasick multi-pattern automaton over bytes.
 *
 * Patterns are added, then build() computes failure and dictionary-suffix
 * links once. find_all() is a single left-to-right pass over the haystack in
 * O(n + matches). The automaton is immutable after build() and safe to scan
 * from several threads.
 */
class AhoCorasick {
public:
    struct Match {
        size_t start;          // first byte of the match
        size_t end;            // one past the last byte
        uint32_t pattern_id;
    };

    AhoCorasick();

    // Returns the pattern id. Adding the same bytes twice returns the first id.
    uint32_t add_pattern(std::string_view pattern);

    void build();

    std::vector<Match> find_all(std::string_view haystack) const;

    size_t pattern_count() const noexcept { return pattern_lengths_.size(); }
    size_t node_count() const noexcept { return nodes_.size(); }
    size_t pattern_length(uint32_t id) const { return pattern_lengths_.at(id); }
    bool built() const noexcept { return built_; }

private:
    static constexpr int32_t kNone = -1;

    struct Node {
        std::unordered_map<unsigned char, int32_t> next;
        int32_t fail = 0;
        int32_t dict = kNone;      // nearest suffix node that ends a pattern
        int32_t pattern = kNone;   // pattern ending exactly here
    };

    int32_t step(int32_t state, unsigned char c) const;

    std::vector<Node> nodes_;
    std::vector<size_t> pattern_lengths_;
    bool built_ = false;
};

} // namespace promptspan
