#pragma once

/// @file bitset.hpp
/// @brief Growable bit set for prism_structures
///
/// BitSet stores a set of small integer indices (component ids) and
/// grows on demand. Used for access sets and archetype signatures.

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <bit>
#include <iterator>

namespace prism_structures {

/// Dynamic, auto-growing bit-level storage
class BitSet {
public:
    using word_type = std::uint64_t;
    using size_type = std::size_t;

    static constexpr size_type BITS_PER_WORD = 64;

private:
    std::vector<word_type> bits_;

    [[nodiscard]] static constexpr size_type words_for_bits(size_type n) noexcept {
        return (n + BITS_PER_WORD - 1) / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr size_type word_index(size_type bit) noexcept {
        return bit / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr size_type bit_offset(size_type bit) noexcept {
        return bit % BITS_PER_WORD;
    }

    /// Word at index, zero past the end
    [[nodiscard]] word_type word_at(size_type i) const noexcept {
        return i < bits_.size() ? bits_[i] : 0;
    }

    void grow_for(size_type index) {
        size_type needed = words_for_bits(index + 1);
        if (bits_.size() < needed) {
            bits_.resize(needed, 0);
        }
    }

public:
    // =========================================================================
    // Constructors
    // =========================================================================

    BitSet() = default;

    /// Create from a list of set bit indices
    BitSet(std::initializer_list<size_type> set_bits) {
        for (size_type bit : set_bits) {
            insert(bit);
        }
    }

    // =========================================================================
    // Bit Operations
    // =========================================================================

    /// Set bit, growing storage as needed
    void insert(size_type index) {
        grow_for(index);
        bits_[word_index(index)] |= (word_type(1) << bit_offset(index));
    }

    /// Clear bit
    void remove(size_type index) noexcept {
        if (word_index(index) >= bits_.size()) return;
        bits_[word_index(index)] &= ~(word_type(1) << bit_offset(index));
    }

    [[nodiscard]] bool contains(size_type index) const noexcept {
        return (word_at(word_index(index)) >> bit_offset(index)) & 1;
    }

    void clear() noexcept {
        std::fill(bits_.begin(), bits_.end(), 0);
    }

    // =========================================================================
    // Aggregation
    // =========================================================================

    /// Number of set bits
    [[nodiscard]] size_type count() const noexcept {
        size_type n = 0;
        for (word_type word : bits_) {
            n += static_cast<size_type>(std::popcount(word));
        }
        return n;
    }

    [[nodiscard]] bool empty() const noexcept {
        return std::all_of(bits_.begin(), bits_.end(), [](word_type w) { return w == 0; });
    }

    // =========================================================================
    // Set Operations
    // =========================================================================

    /// True when both sets share at least one index
    [[nodiscard]] bool intersects(const BitSet& other) const noexcept {
        size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            if (bits_[i] & other.bits_[i]) return true;
        }
        return false;
    }

    /// True when every index of this set is in other
    [[nodiscard]] bool is_subset_of(const BitSet& other) const noexcept {
        for (size_type i = 0; i < bits_.size(); ++i) {
            if (bits_[i] & ~other.word_at(i)) return false;
        }
        return true;
    }

    /// Union in place
    BitSet& operator|=(const BitSet& other) {
        if (other.bits_.size() > bits_.size()) {
            bits_.resize(other.bits_.size(), 0);
        }
        for (size_type i = 0; i < other.bits_.size(); ++i) {
            bits_[i] |= other.bits_[i];
        }
        return *this;
    }

    /// Intersection
    [[nodiscard]] BitSet operator&(const BitSet& other) const {
        BitSet result;
        size_type words = std::min(bits_.size(), other.bits_.size());
        result.bits_.resize(words, 0);
        for (size_type i = 0; i < words; ++i) {
            result.bits_[i] = bits_[i] & other.bits_[i];
        }
        return result;
    }

    [[nodiscard]] BitSet operator|(const BitSet& other) const {
        BitSet result = *this;
        result |= other;
        return result;
    }

    // =========================================================================
    // Iterator over set bits
    // =========================================================================

    /// Iterator that yields indices of set bits
    class SetBitIterator {
        const BitSet* bitset_;
        size_type current_;

        void advance_to_next() {
            size_type end = bitset_->bits_.size() * BITS_PER_WORD;
            while (current_ < end && !bitset_->contains(current_)) {
                ++current_;
            }
        }

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = size_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const size_type*;
        using reference = size_type;

        SetBitIterator(const BitSet* bs, size_type start) : bitset_(bs), current_(start) {
            advance_to_next();
        }

        size_type operator*() const { return current_; }

        SetBitIterator& operator++() {
            ++current_;
            advance_to_next();
            return *this;
        }

        SetBitIterator operator++(int) {
            SetBitIterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const SetBitIterator& other) const {
            return current_ == other.current_;
        }

        bool operator!=(const SetBitIterator& other) const {
            return !(*this == other);
        }
    };

    /// Range for iterating over set bit indices
    class SetBitRange {
        const BitSet* bitset_;
    public:
        explicit SetBitRange(const BitSet* bs) : bitset_(bs) {}
        SetBitIterator begin() const { return SetBitIterator(bitset_, 0); }
        SetBitIterator end() const {
            return SetBitIterator(bitset_, bitset_->bits_.size() * BITS_PER_WORD);
        }
    };

    /// Iterate over indices of set bits
    [[nodiscard]] SetBitRange iter_ones() const { return SetBitRange(this); }

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Equal when the same indices are set, regardless of storage length
    bool operator==(const BitSet& other) const noexcept {
        size_type words = std::max(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            if (word_at(i) != other.word_at(i)) return false;
        }
        return true;
    }

    bool operator!=(const BitSet& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace prism_structures
