#pragma once

#include <utility>

#include "util/absl.hpp"

namespace mr::detail {
    /// @brief Non overlapping segments ordered by address.
    ///
    /// Segments are keyed by the end of their range so the segment containing an
    /// address is the first one whose end is past it.
    template<typename T>
    class RangeTable {
    public:
        using Segment = T;
        using Range = decltype(std::declval<Segment>().range);
        using Address = typename Range::ValueType;
        using Map = sm::BTreeMap<Address, Segment>;

    private:
        Map mSegments;

    public:
        using Iterator = typename Map::iterator;
        using ConstIterator = typename Map::const_iterator;

        RangeTable() noexcept = default;

        /// @brief Return an iterator to the segment that contains the given address.
        Iterator find(Address address) noexcept {
            if (auto it = mSegments.upper_bound(address); it != mSegments.end()) {
                if (it->second.range.contains(address)) {
                    return it;
                }
            }

            return mSegments.end();
        }

        ConstIterator find(Address address) const noexcept {
            if (auto it = mSegments.upper_bound(address); it != mSegments.end()) {
                if (it->second.range.contains(address)) {
                    return it;
                }
            }

            return mSegments.end();
        }

        /// @brief Does any segment share area with @p range.
        bool intersects(Range range) const noexcept {
            auto it = mSegments.upper_bound(range.front);
            return it != mSegments.end() && it->second.range.intersects(range);
        }

        Iterator begin() noexcept { return mSegments.begin(); }
        Iterator end() noexcept { return mSegments.end(); }

        ConstIterator begin() const noexcept { return mSegments.begin(); }
        ConstIterator end() const noexcept { return mSegments.end(); }

        Iterator insert(Segment segment) {
            Address key = segment.range.back;
            return mSegments.insert({ key, segment }).first;
        }

        Iterator erase(Iterator it) noexcept {
            return mSegments.erase(it);
        }

        size_t count() const noexcept {
            return mSegments.size();
        }

        bool isEmpty() const noexcept {
            return mSegments.empty();
        }
    };
}
