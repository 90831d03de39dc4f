#pragma once

#include <unordered_map>
#include <vector>
#include <string>
#include <utility>

namespace moordns {

/**
 * Map that iterates its entries in first-insertion order.
 * Keys are never removed.
 */
template<typename K, typename V> class OrderedMap {
	std::unordered_map<K, std::size_t> index;
	std::vector<std::pair<K, V>> entries;
	public:
		using iterator = typename std::vector<std::pair<K, V>>::iterator;
		using const_iterator = typename std::vector<std::pair<K, V>>::const_iterator;
		OrderedMap() = default;
		/// Value under `k`, default-inserted at the back if `k` is new
		V& operator[](const K& k){
			auto it = index.find(k);
			if(it != index.end()) return entries[it->second].second;
			index.emplace(k, entries.size());
			entries.emplace_back(k, V{});
			return entries.back().second;
		}
		const V* find(const K& k) const {
			auto it = index.find(k);
			return it == index.end() ? nullptr : &entries[it->second].second;
		}
		bool contains(const K& k) const { return index.count(k) > 0; }
		std::size_t size() const { return entries.size(); }
		bool empty() const { return entries.empty(); }
		iterator begin(){ return entries.begin(); }
		iterator end(){ return entries.end(); }
		const_iterator begin() const { return entries.begin(); }
		const_iterator end() const { return entries.end(); }
};

}
