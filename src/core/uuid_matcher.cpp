#include "core/uuid_matcher.hpp"

#include <array>

namespace uuidstamp {
namespace {

// Per-position character classes of the version-1 layout.
enum class Slot : unsigned char { Hex, Dash, Version, Variant };

constexpr std::array<Slot, kUuidTextLength> make_layout() {
    std::array<Slot, kUuidTextLength> layout{};
    for (auto& s : layout) s = Slot::Hex;
    layout[8] = Slot::Dash;
    layout[13] = Slot::Dash;
    layout[14] = Slot::Version;
    layout[18] = Slot::Dash;
    layout[19] = Slot::Variant;
    layout[23] = Slot::Dash;
    return layout;
}

constexpr auto kLayout = make_layout();

constexpr bool is_lower_hex(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

// ASCII only; bytes of multi-byte UTF-8 sequences are boundaries.
constexpr bool is_word_char(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') || c == '_';
}

bool slot_accepts(Slot slot, char c) noexcept {
    switch (slot) {
        case Slot::Hex: return is_lower_hex(c);
        case Slot::Dash: return c == '-';
        case Slot::Version: return c == '1';
        case Slot::Variant: return c == '8' || c == '9' || c == 'a' || c == 'b';
    }
    return false;
}

bool bounded_match_at(std::string_view text, size_t pos) noexcept {
    if (pos + kUuidTextLength > text.size()) return false;
    if (pos > 0 && is_word_char(text[pos - 1])) return false;
    const size_t end = pos + kUuidTextLength;
    if (end < text.size() && is_word_char(text[end])) return false;
    return matches_v1_pattern(text.substr(pos, kUuidTextLength));
}

} // namespace

bool matches_v1_pattern(std::string_view text) noexcept {
    if (text.size() != kUuidTextLength) return false;
    for (size_t i = 0; i < kUuidTextLength; ++i) {
        if (!slot_accepts(kLayout[i], text[i])) return false;
    }
    return true;
}

std::optional<CandidateUuid> find_next(std::string_view text, size_t from) {
    if (text.size() < kUuidTextLength) return std::nullopt;
    const size_t last = text.size() - kUuidTextLength;
    for (size_t pos = from; pos <= last; ++pos) {
        if (bounded_match_at(text, pos)) {
            return CandidateUuid{std::string(text.substr(pos, kUuidTextLength)), pos};
        }
    }
    return std::nullopt;
}

std::optional<CandidateUuid> match_at(std::string_view text, size_t position) {
    size_t from = position > kUuidTextLength ? position - kUuidTextLength : 0;
    while (auto candidate = find_next(text, from)) {
        if (candidate->offset > position) break;
        if (position <= candidate->offset + kUuidTextLength) return candidate;
        from = candidate->offset + kUuidTextLength;
    }
    return std::nullopt;
}

UuidMatches::iterator::iterator(std::string_view text, size_t from)
    : text_(text), current_(find_next(text, from)) {}

UuidMatches::iterator& UuidMatches::iterator::operator++() {
    if (current_) {
        current_ = find_next(text_, current_->offset + kUuidTextLength);
    }
    return *this;
}

std::vector<CandidateUuid> UuidMatches::collect() const {
    std::vector<CandidateUuid> out;
    for (const auto& candidate : *this) {
        out.push_back(candidate);
    }
    return out;
}

} // namespace uuidstamp
