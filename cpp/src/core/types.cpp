#include "promptspan/types.hpp"

namespace promptspan {

const char* to_string(SpanSource source) noexcept {
    switch (source) {
        case SpanSource::ClosedVocab:     return "closed-vocab";
        case SpanSource::Pattern:         return "pattern";
        case SpanSource::ActionHeuristic: return "action-heuristic";
        case SpanSource::Lighting:        return "lighting";
        case SpanSource::OpenVocab:       return "open-vocab";
    }
    return "unknown";
}

int source_priority(SpanSource source) noexcept {
    switch (source) {
        case SpanSource::ClosedVocab:
        case SpanSource::Pattern:
            return 3;
        case SpanSource::OpenVocab:
            return 2;
        case SpanSource::ActionHeuristic:
        case SpanSource::Lighting:
            return 1;
    }
    return 0;
}

Span to_span(const CandidateSpan& candidate) {
    Span span;
    span.text = candidate.text;
    span.role = candidate.role;
    span.confidence = candidate.confidence;
    span.start = candidate.start;
    span.end = candidate.end;
    return span;
}

std::vector<Span> to_spans(const std::vector<CandidateSpan>& candidates) {
    std::vector<Span> spans;
    spans.reserve(candidates.size());
    for (const auto& c : candidates) {
        spans.push_back(to_span(c));
    }
    return spans;
}

} // namespace promptspan
