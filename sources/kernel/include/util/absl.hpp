#pragma once

#include <absl/container/btree_map.h>

namespace sm {
    template<typename TKey, typename TValue, typename TCompare = std::less<TKey>>
    using BTreeMap = absl::btree_map<TKey, TValue, TCompare>;
}
