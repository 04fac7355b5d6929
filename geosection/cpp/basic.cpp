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
#include "basic.hpp"
#include <algorithm>
#include <numeric>

// Is geosection verbose.
bool geosection_verbose = false;

const char * error_kind_name( ErrorKind kind )
{
	switch ( kind ) {
		case ErrorKind::None:
			return "None";
		case ErrorKind::InvalidCoordinate:
			return "InvalidCoordinate";
		case ErrorKind::InvalidBufferWidth:
			return "InvalidBufferWidth";
		case ErrorKind::DegenerateInput:
			return "DegenerateInput";
		case ErrorKind::TransformFailure:
			return "TransformFailure";
		case ErrorKind::InvalidParameter:
			return "InvalidParameter";
		default:
			return "Unknown";
	}
}

GeosectionException::GeosectionException(ErrorKind kind, const string& what)
:std::runtime_error(string(error_kind_name(kind)) + ": " + what), error_kind(kind), error_detail(what)
{
}

const string& GeosectionException::detail() const
{
	return this->error_detail;
}

ErrorKind GeosectionException::kind() const
{
	return this->error_kind;
}

wstring human_failure_type( const geometry::validity_failure_type& fail )
{
	switch ( fail ) {
		case geometry::validity_failure_type::no_failure:
			return L"no failure";
		case geometry::validity_failure_type::failure_few_points:
			return L"failure few points";
		case geometry::validity_failure_type::failure_wrong_topological_dimension:
			return L"failure wrong topological dimension";
		case geometry::validity_failure_type::failure_spikes:
			return L"failure spikes";
		case geometry::validity_failure_type::failure_duplicate_points:
			return L"failure duplicate points";
		case geometry::validity_failure_type::failure_not_closed:
			return L"failure not closed";
		case geometry::validity_failure_type::failure_self_intersections:
			return L"failure self intersections";
		case geometry::validity_failure_type::failure_wrong_orientation:
			return L"failure wrong orientation";
		default:
			return L"unknown";
	}
}

std::tuple<point2, double> point_segment_projection( const point2& pt, const point2& ps, const point2& pe )
{
	double x  = gx(pt);
	double y  = gy(pt);
	double x1 = gx(ps);
	double y1 = gy(ps);
	double x2 = gx(pe);
	double y2 = gy(pe);

	double A = x - x1;
	double B = y - y1;
	double C = x2 - x1;
	double D = y2 - y1;

	double dot = A * C + B * D;
	double len_sq = C * C + D * D;

	double xx, yy;
	if ( len_sq <= tolerance ) {
		xx = x1;
		yy = y1;
	} else {
		double param = dot / len_sq;
		if ( param < 0 ) {
			xx = x1;
			yy = y1;
		} else if ( param > 1 ) {
			xx = x2;
			yy = y2;
		} else {
			xx = x1 + param * C;
			yy = y1 + param * D;
		}
	}

	double dx = x - xx;
	double dy = y - yy;
	return std::make_tuple( point2( xx, yy ), dx * dx + dy * dy );
}

// Sorts the indexes of a vector<double> based on its values, equal values keep their order.
//	  v: vector.
vector<size_t> sort_indexes(const vector<double> &v) {

  // initialize original index locations
  vector<size_t> idx(v.size());
  std::iota(idx.begin(), idx.end(), 0);

  // sort indexes based on comparing values in v
  std::stable_sort(idx.begin(), idx.end(),
	   [&v](size_t i1, size_t i2) {return v[i1] < v[i2];});

  return idx;
}

bool finite_point( double x, double y )
{
	return std::isfinite(x) and std::isfinite(y);
}
