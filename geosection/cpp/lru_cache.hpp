/*
	Geosection engine. Spatial selection and section-line tools for borehole surveys.
	Copyright (C) 2016 Geomodelr, Inc.

	This program is free software: you can redistribute it and/or modify
	it under the terms of the GNU Affero General Public License as
	published by the Free Software Foundation, either version 3 of the
	License, or (at your option) any later version.

	This program is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
	GNU Affero General Public License for more details.

	You should have received a copy of the GNU Affero General Public License
	along with this program. If not, see <http://www.gnu.org/licenses/>.
*/
#ifndef GEOSECTION_LRU_CACHE_HPP
#define GEOSECTION_LRU_CACHE_HPP
#include <list>
#include <map>
#include <mutex>
#include <utility>
#include <cstddef>

// Bounded least recently used map. Every method takes the lock, so one instance
// can be shared between threads.
template<class Key, class Value>
class LRUCache {
	typedef std::pair<Key, Value> entry;
	typedef typename std::list<entry>::iterator entry_it;

	size_t max_size;
	std::list<entry> entries; // Most recent first.
	std::map<Key, entry_it> index;
	mutable std::mutex lock;

	void evict() {
		while ( this->entries.size() > this->max_size ) {
			this->index.erase( this->entries.back().first );
			this->entries.pop_back();
		}
	}

public:
	explicit LRUCache( size_t capacity ): max_size(capacity > 0 ? capacity : 1) {
	}

	// Copies the cached value into out and marks it as recently used.
	bool get( const Key& k, Value& out ) {
		std::lock_guard<std::mutex> guard(this->lock);
		auto it = this->index.find(k);
		if ( it == this->index.end() ) {
			return false;
		}
		this->entries.splice( this->entries.begin(), this->entries, it->second );
		out = it->second->second;
		return true;
	}

	void put( const Key& k, const Value& v ) {
		std::lock_guard<std::mutex> guard(this->lock);
		auto it = this->index.find(k);
		if ( it != this->index.end() ) {
			it->second->second = v;
			this->entries.splice( this->entries.begin(), this->entries, it->second );
			return;
		}
		this->entries.push_front( std::make_pair(k, v) );
		this->index[k] = this->entries.begin();
		this->evict();
	}

	size_t size() const {
		std::lock_guard<std::mutex> guard(this->lock);
		return this->entries.size();
	}

	size_t capacity() const {
		std::lock_guard<std::mutex> guard(this->lock);
		return this->max_size;
	}

	void set_capacity( size_t capacity ) {
		std::lock_guard<std::mutex> guard(this->lock);
		this->max_size = capacity > 0 ? capacity : 1;
		this->evict();
	}

	void clear() {
		std::lock_guard<std::mutex> guard(this->lock);
		this->entries.clear();
		this->index.clear();
	}
};

#endif
