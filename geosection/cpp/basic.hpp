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

#ifndef GEOSECTION_BASIC_HPP
#define GEOSECTION_BASIC_HPP

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/geometries.hpp>

#include <iostream>
#include <vector>
#include <tuple>
#include <utility>
#include <string>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <cmath>

using namespace boost;
using std::vector;
using std::string;
using std::wstring;
using std::map;

static const double tolerance = 1e-15;
static const double epsilon = 1e-9;

typedef geometry::model::point<double, 2, geometry::cs::cartesian> point2;
typedef geometry::model::segment<point2> line_segment;
typedef geometry::model::box<point2> box;
typedef geometry::model::polygon<point2, false, false> polygon;
typedef geometry::model::multi_polygon<polygon> multi_polygon;

typedef polygon::ring_type ring;
typedef geometry::model::linestring<point2> line;

template<class Point>
inline typename geometry::coordinate_type<Point>::type gx(const Point& p){
	return geometry::get<0, Point>(p);
}

template<class Point>
inline typename geometry::coordinate_type<Point>::type gy(const Point& p){
	return geometry::get<1, Point>(p);
}

template<class T>
inline const typename std::tuple_element<0, T>::type& g0(const T& t){
	return std::get<0>(t);
}
template<class T>
inline const typename std::tuple_element<1, T>::type& g1(const T& t){
	return std::get<1>(t);
}

template<class T>
inline typename std::tuple_element<0, T>::type& g0(T& t){
	return std::get<0>(t);
}
template<class T>
inline typename std::tuple_element<1, T>::type& g1(T& t){
	return std::get<1>(t);
}

enum class ErrorKind {
	None,
	InvalidCoordinate,
	InvalidBufferWidth,
	DegenerateInput,
	TransformFailure,
	InvalidParameter
};

const char * error_kind_name( ErrorKind kind );

struct GeosectionException : std::runtime_error
{
	GeosectionException(ErrorKind kind, const string&);
	ErrorKind kind() const;
	// The message without the kind.
	const string& detail() const;
private:
	ErrorKind error_kind;
	string error_detail;
};

wstring human_failure_type( const geometry::validity_failure_type& fail );

// Closest point of segment ps-pe to pt, and the squared distance to it.
std::tuple<point2, double> point_segment_projection( const point2& pt, const point2& ps, const point2& pe );

vector<size_t> sort_indexes(const vector<double> &v);

bool finite_point( double x, double y );

// Is geosection verbose.
extern bool geosection_verbose;

#endif
