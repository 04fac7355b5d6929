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
#ifndef GEOSECTION_COORDINATES_HPP
#define GEOSECTION_COORDINATES_HPP
#include "basic.hpp"
#include "params.hpp"
#include "shapes.hpp"
#include "lru_cache.hpp"
#include <boost/geometry/srs/transformation.hpp>
#include <atomic>
#include <mutex>

// Geographic coordinates go x first: x is longitude, y is latitude, in degrees.
enum class CoordinateSystem {
	NationalGrid,   // British National Grid, EPSG:27700.
	Geographic,     // WGS84 longitude and latitude, EPSG:4326.
	LocalProjected, // WGS84 UTM, the zone is part of the frame.
	WebMercator     // EPSG:3857.
};

const char * system_name( CoordinateSystem system );

struct UtmZone {
	int number;
	bool south;
	UtmZone(): number(0), south(false) {
	}
	UtmZone( int number, bool south ): number(number), south(south) {
	}
	// Zone holding the given WGS84 position.
	static UtmZone from_lon_lat( double lon, double lat );
	bool operator==( const UtmZone& o ) const {
		return this->number == o.number and this->south == o.south;
	}
	bool operator!=( const UtmZone& o ) const {
		return not (*this == o);
	}
};

// A coordinate system together with its zone when it is LocalProjected.
struct Frame {
	CoordinateSystem system;
	optional<UtmZone> zone;
	Frame( CoordinateSystem system ): system(system) {
	}
	Frame( const UtmZone& zone ): system(CoordinateSystem::LocalProjected), zone(zone) {
	}
	bool operator==( const Frame& o ) const;
};

// Frames by name: NationalGrid, Geographic, WebMercator, LocalProjected (zone
// taken from the points) or a zone like UTM30N or UTM30S.
Frame frame_from_name( const wstring& name );
wstring zone_name( const UtmZone& zone );

struct TransformResult {
	bool ok;
	point2 point;
	ErrorKind error;
	string message;
	TransformResult(): ok(false), point(0.0, 0.0), error(ErrorKind::None) {
	}
};

struct CacheStats {
	unsigned long hits;
	unsigned long misses;
	unsigned long errors;
	size_t size;
	size_t capacity;
};

class CoordinateTransformService {
	typedef std::tuple<int, int, int, int, long long, long long> cache_key;
	typedef geometry::srs::transformation<> transformation;

	Params parameters;
	mutable std::mutex parameters_lock;
	LRUCache<cache_key, point2> cache;
	map<std::pair<string, string>, std::shared_ptr<transformation>> transformers;
	mutable std::mutex transformers_lock;
	std::atomic<unsigned long> hits;
	std::atomic<unsigned long> misses;
	std::atomic<unsigned long> errors;

	std::shared_ptr<transformation> transformer( const Frame& source, const Frame& target );
	point2 convert( const Frame& source, const Frame& target, double x, double y );
	point2 transform_checked( const Frame& source, const Frame& target, double x, double y );
	TransformResult try_transform( const Frame& source, const Frame& target, double x, double y );

public:
	CoordinateTransformService();
	explicit CoordinateTransformService( const Params& params );

	// Transforms one point. Throws GeosectionException with InvalidCoordinate or
	// TransformFailure. A LocalProjected target without zone takes the zone of the point.
	point2 transform_point( const Frame& source, const Frame& target, double x, double y );

	// Transforms all points into one frame. Failures are reported per index, the
	// result has the same length and order as pts. A LocalProjected frame without
	// zone takes the zone of the centroid of pts.
	vector<TransformResult> transform_batch( const Frame& source, const Frame& target, const vector<point2>& pts );

	// UTM zone of the centroid of the points, the points that can't be located are ignored.
	UtmZone local_zone( const Frame& source, const vector<point2>& pts );

	// Fills the geographic and projected coordinates that are missing, all the
	// projected ones in the same zone. Returns the zone used, none when no point could be located.
	optional<UtmZone> populate( vector<SurveyPoint>& points );

	CacheStats cache_stats() const;
	void clear_cache();

	// A copy of the current parameters, they can be changed from another thread.
	Params params() const;
	void set_params( const map<wstring, wstring>& params );
};

#endif
