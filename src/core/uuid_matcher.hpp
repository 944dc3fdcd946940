#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <vector>

namespace uuidstamp {

/**
 * True if `text` is exactly one version-1 UUID:
 * xxxxxxxx-xxxx-1xxx-[89ab]xxx-xxxxxxxxxxxx with lowercase hex digits.
 */
[[nodiscard]] bool matches_v1_pattern(std::string_view text) noexcept;

/**
 * Find the first version-1 UUID starting at or after `from`.
 *
 * A match must sit on word boundaries on both ends: the neighbouring
 * characters (if any) must not be ASCII letters, digits or '_'.
 * Uppercase hex never matches.
 */
[[nodiscard]] std::optional<CandidateUuid> find_next(std::string_view text, size_t from);

/**
 * The match whose span contains `position`, treating the position just past
 * the last character as inside (a cursor sitting after the UUID).
 */
[[nodiscard]] std::optional<CandidateUuid> match_at(std::string_view text, size_t position);

/**
 * UuidMatches - Lazy, restartable sequence of non-overlapping matches.
 *
 * Each call to begin() rescans from the start of the text, so iterating
 * twice yields identical results. The sequence only views the text; the
 * caller keeps it alive while iterating.
 */
class UuidMatches {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = CandidateUuid;
        using difference_type = std::ptrdiff_t;
        using pointer = const CandidateUuid*;
        using reference = const CandidateUuid&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++();
        iterator operator++(int) {
            auto copy = *this;
            ++*this;
            return copy;
        }

        bool operator==(const iterator& other) const {
            return current_.has_value() == other.current_.has_value() &&
                   (!current_ || current_->offset == other.current_->offset);
        }

    private:
        friend class UuidMatches;
        iterator(std::string_view text, size_t from);

        std::string_view text_;
        std::optional<CandidateUuid> current_;
    };

    explicit UuidMatches(std::string_view text) noexcept : text_(text) {}

    [[nodiscard]] iterator begin() const { return iterator(text_, 0); }
    [[nodiscard]] iterator end() const { return iterator(); }

    [[nodiscard]] bool empty() const { return begin() == end(); }

    /**
     * Materialize the whole sequence.
     */
    [[nodiscard]] std::vector<CandidateUuid> collect() const;

private:
    std::string_view text_;
};

/**
 * find_all - Entry point of the matcher.
 */
[[nodiscard]] inline UuidMatches find_all(std::string_view text) noexcept {
    return UuidMatches(text);
}

} // namespace uuidstamp
