#pragma once

#include <vector>
#include <cstddef> // size_t
#include <stdexcept>

// A fast-compiling, low LOC, replacement for std::map.
// Uses linear search for lookup, should be OK for small maps.
// Iteration follows insertion order. Don't use with a huge element count.
template<typename Key, typename Value>
struct SmallMap {
	struct Pair {
		Key key;
		Value value;
	};

	struct Iterator {
		SmallMap* parent;
		int idx;

		bool operator==(const Iterator& other) const {
			return idx == other.idx;
		}

		bool operator!=(const Iterator& other) const {
			return idx != other.idx;
		}

		void operator++() {
			idx++;
		}

		Pair& operator*() {
			return parent->pairs[idx];
		}

		Pair* operator->() {
			return &parent->pairs[idx];
		}
	};

	std::vector<Pair> pairs;

	Value& operator[](Key key) {
		auto i = find(key);
		if(i != end())
			return (*i).value;

		pairs.push_back({key, {}});
		return pairs[pairs.size()-1].value;
	}

	const Value& at(Key key) const {
		auto i = find(key);
		if(i == end())
			throw std::out_of_range("SmallMap: unknown key");
		return (*i).value;
	}

	Iterator find(Key key) const {
		for(int i=0; i < (int)pairs.size(); ++i)
			if(key == pairs[i].key)
				return {const_cast<SmallMap<Key, Value>*>(this), i};

		return end();
	}

	bool contains(Key key) const {
		return find(key) != end();
	}

	Iterator begin() const {
		return {const_cast<SmallMap<Key, Value>*>(this), 0};
	}

	Iterator end() const {
		return {const_cast<SmallMap<Key, Value>*>(this), (int)pairs.size()};
	}

	bool empty() const {
		return pairs.empty();
	}

	size_t size() const {
		return pairs.size();
	}
};
