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
#ifndef GEOSECTION_SELECTION_HPP
#define GEOSECTION_SELECTION_HPP
#include "basic.hpp"
#include "shapes.hpp"
#include "coordinates.hpp"

// Ring in (lon, lat) with its bounding box, for the crossing number test.
class Polygon {
protected:
	vector<point2> nodes; // Open, no repeated consecutive nodes.
	box bbox;

public:
	Polygon( const vector<point2>& vertices );

	// Less than three distinct nodes, or non finite ones, contain nothing.
	bool valid() const;
	// Even-odd ray crossing. Points on an edge get the same answer on every call.
	bool contains( const point2& pt ) const;
	const box& envelope() const;
};

class SpatialFilter {
	CoordinateTransformService& service;

	vector<optional<point2>> locate( const vector<SurveyPoint>& points );
	vector<wstring> select_inside( const vector<SurveyPoint>& points, const Polygon& poly );

public:
	explicit SpatialFilter( CoordinateTransformService& service );

	// Ids of the points inside the shape, in the order of points. A degenerate shape,
	// or one that can't be built, selects nothing. Points without geographic
	// coordinates are located from their grid ones, the input isn't modified.
	vector<wstring> select_points_in_shape( const vector<SurveyPoint>& points, const ShapeDescriptor& shape );

	vector<wstring> select_polygon( const vector<SurveyPoint>& points, const PolygonShape& shape );
	vector<wstring> select_rectangle( const vector<SurveyPoint>& points, const RectangleShape& shape );
	vector<wstring> select_polyline( const vector<SurveyPoint>& points, const PolylineShape& shape );
};

#endif
