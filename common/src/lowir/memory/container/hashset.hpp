#pragma once

#include <functional>
#include <unordered_set>

namespace lowir::memory {

template <typename Key, typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
using hash_set = std::unordered_set<Key, Hash, KeyEqual>;

}
