#include "promptspan/aho_corasick.hpp"
#include "promptspan/error.hpp"

#include <deque>

namespace promptspan {

AhoCorasick::AhoCorasick() {
    nodes_.emplace_back();
}

uint32_t AhoCorasick::add_pattern(std::string_view pattern) {
    PROMPTSPAN_CHECK_ARGUMENT(!built_, "cannot add patterns after build()");
    PROMPTSPAN_CHECK_ARGUMENT(!pattern.empty(), "empty pattern");

    int32_t state = 0;
    for (char ch : pattern) {
        unsigned char c = static_cast<unsigned char>(ch);
        auto it = nodes_[state].next.find(c);
        if (it == nodes_[state].next.end()) {
            int32_t created = static_cast<int32_t>(nodes_.size());
            nodes_.emplace_back();
            nodes_[state].next.emplace(c, created);
            state = created;
        } else {
            state = it->second;
        }
    }

    if (nodes_[state].pattern != kNone) {
        return static_cast<uint32_t>(nodes_[state].pattern);
    }

    uint32_t id = static_cast<uint32_t>(pattern_lengths_.size());
    pattern_lengths_.push_back(pattern.size());
    nodes_[state].pattern = static_cast<int32_t>(id);
    return id;
}

void AhoCorasick::build() {
    // Breadth-first so every node's failure target is final before its children need it.
    std::deque<int32_t> queue;
    for (const auto& [c, child] : nodes_[0].next) {
        nodes_[child].fail = 0;
        queue.push_back(child);
    }

    while (!queue.empty()) {
        int32_t state = queue.front();
        queue.pop_front();

        for (const auto& [c, child] : nodes_[state].next) {
            int32_t f = nodes_[state].fail;
            while (f != 0 && !nodes_[f].next.count(c)) {
                f = nodes_[f].fail;
            }
            auto it = nodes_[f].next.find(c);
            int32_t target = (it != nodes_[f].next.end() && it->second != child) ? it->second : 0;

            nodes_[child].fail = target;
            nodes_[child].dict = nodes_[target].pattern != kNone ? target : nodes_[target].dict;
            queue.push_back(child);
        }
    }

    built_ = true;
}

int32_t AhoCorasick::step(int32_t state, unsigned char c) const {
    while (true) {
        auto it = nodes_[state].next.find(c);
        if (it != nodes_[state].next.end()) {
            return it->second;
        }
        if (state == 0) {
            return 0;
        }
        state = nodes_[state].fail;
    }
}

std::vector<AhoCorasick::Match> AhoCorasick::find_all(std::string_view haystack) const {
    PROMPTSPAN_CHECK_ARGUMENT(built_, "find_all() before build()");

    std::vector<Match> matches;
    int32_t state = 0;

    for (size_t i = 0; i < haystack.size(); ++i) {
        state = step(state, static_cast<unsigned char>(haystack[i]));

        const size_t end = i + 1;
        for (int32_t s = nodes_[state].pattern != kNone ? state : nodes_[state].dict;
             s != kNone; s = nodes_[s].dict) {
            uint32_t id = static_cast<uint32_t>(nodes_[s].pattern);
            matches.push_back({end - pattern_lengths_[id], end, id});
        }
    }

    return matches;
}

} // namespace promptspan
