/*
	Copyright (C) 2003-2013 by David White <davewx7@gmail.com>
	
	This software is provided 'as-is', without any express or implied
	warranty. In no event will the authors be held liable for any damages
	arising from the use of this software.

	Permission is granted to anyone to use this software for any purpose,
	including commercial applications, and to alter it and redistribute it
	freely, subject to the following restrictions:

	   1. The origin of this software must not be misrepresented; you must not
	   claim that you wrote the original software. If you use this software
	   in a product, an acknowledgement in the product documentation would be
	   appreciated but is not required.

	   2. Altered source versions must be plainly marked as such, and must not be
	   misrepresented as being the original software.

	   3. This notice may not be removed or altered from any source
	   distribution.
*/

#pragma once

#include <cstddef>
#include <list>
#include <map>

// Bounded map that evicts the least recently used entry. Not thread safe;
// owners serialize access themselves.
template<typename Key, typename Value>
class LruCache
{
public:
	typedef std::list<std::pair<Key, Value>> list_type;
	typedef std::map<Key, typename list_type::iterator> map_type;

	explicit LruCache(size_t capacity) : capacity_(capacity), hits_(0), misses_(0) {}

	size_t size() const { return map_.size(); }
	size_t capacity() const { return capacity_; }

	// Returns nullptr on a miss. A hit becomes the most recently used entry.
	const Value* get(const Key& key) {
		typename map_type::iterator itor = map_.find(key);
		if(itor == map_.end()) {
			++misses_;
			return nullptr;
		}

		++hits_;
		entries_.splice(entries_.begin(), entries_, itor->second);
		return &itor->second->second;
	}

	void put(const Key& key, const Value& value) {
		if(capacity_ == 0) {
			return;
		}

		typename map_type::iterator itor = map_.find(key);
		if(itor != map_.end()) {
			itor->second->second = value;
			entries_.splice(entries_.begin(), entries_, itor->second);
			return;
		}

		while(map_.size() >= capacity_) {
			map_.erase(entries_.back().first);
			entries_.pop_back();
		}

		entries_.emplace_front(key, value);
		map_[key] = entries_.begin();
	}

	void erase(const Key& key) {
		typename map_type::iterator itor = map_.find(key);
		if(itor != map_.end()) {
			entries_.erase(itor->second);
			map_.erase(itor);
		}
	}

	int count(const Key& key) const {
		return map_.count(key);
	}

	void clear() {
		map_.clear();
		entries_.clear();
	}

	int hits() const { return hits_; }
	int misses() const { return misses_; }
private:
	size_t capacity_;
	list_type entries_;
	map_type map_;
	int hits_;
	int misses_;
};
