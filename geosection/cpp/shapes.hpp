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
#ifndef GEOSECTION_SHAPES_HPP
#define GEOSECTION_SHAPES_HPP
#include "basic.hpp"
#include <boost/optional.hpp>
#include <boost/variant.hpp>

struct LatLon {
	double lat;
	double lon;
	LatLon(): lat(0.0), lon(0.0) {
	}
	LatLon( double lat, double lon ): lat(lat), lon(lon) {
	}
};

// A borehole as loaded from the survey. grid_x and grid_y are national grid
// easting and northing, the rest is filled on demand and never changed once set.
struct SurveyPoint {
	wstring id;
	double grid_x;
	double grid_y;
	optional<double> geo_lat;
	optional<double> geo_lon;
	optional<double> proj_x;
	optional<double> proj_y;

	SurveyPoint(): grid_x(0.0), grid_y(0.0) {
	}
	SurveyPoint( const wstring& id, double grid_x, double grid_y ): id(id), grid_x(grid_x), grid_y(grid_y) {
	}

	bool has_geo() const {
		return this->geo_lat and this->geo_lon;
	}
	bool has_proj() const {
		return this->proj_x and this->proj_y;
	}
};

struct PolygonShape {
	vector<LatLon> vertices;
};

// Two opposite corners, in any order.
struct RectangleShape {
	LatLon first;
	LatLon second;
};

struct PolylineShape {
	vector<LatLon> vertices;
	double half_width_meters;
	PolylineShape(): half_width_meters(0.0) {
	}
};

typedef variant<PolygonShape, RectangleShape, PolylineShape> ShapeDescriptor;

// Closed ring, the first vertex is repeated at the end.
struct BufferPolygon {
	vector<LatLon> vertices;
};

#endif
