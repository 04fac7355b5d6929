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
#ifndef GEOSECTION_SECTION_HPP
#define GEOSECTION_SECTION_HPP
#include "basic.hpp"
#include "shapes.hpp"

// Straight section line in projected coordinates. The direction is a unit vector.
struct SectionLine {
	double origin_x;
	double origin_y;
	double direction_x;
	double direction_y;
};

struct Projection {
	wstring point_id;
	double distance_along_line;
	double perpendicular_offset;
};

struct PolylineProjection {
	wstring point_id;
	double distance_along_polyline;
	double distance_to_polyline;
};

// Principal axis of the points, through their centroid.
// Throws DegenerateInput with less than two points or when all of them coincide.
SectionLine fit_line( const vector<point2>& points, double tol = 1e-9 );

// Projects the points on the line and sorts them by distance along it.
// The line is oriented so the first point doesn't go after the last one, and when
// both project the same, towards positive x. Distances closer than 1e-9 are equal
// and keep the input order. Throws InvalidCoordinate if a point isn't projected.
vector<Projection> project_and_order( const vector<SurveyPoint>& points, const SectionLine& line );

// Ends of the drawn section: the span of the points along the line, extended
// at both sides by extension times its length.
std::pair<point2, point2> section_extent( const SectionLine& line, const vector<SurveyPoint>& points, double extension );

// Chainage of the points along a polyline section and their distance to it, in
// projected coordinates. Points farther than max_offset are left out.
vector<PolylineProjection> project_along_polyline( const vector<SurveyPoint>& points, const vector<point2>& polyline, double max_offset );

#endif
