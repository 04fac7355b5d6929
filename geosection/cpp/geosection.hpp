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
#ifndef GEOSECTION_GEOSECTION_HPP
#define GEOSECTION_GEOSECTION_HPP
#include <boost/python.hpp>
#include "basic.hpp"
#include "coordinates.hpp"
#include "corridor.hpp"
#include "selection.hpp"
#include "section.hpp"

typedef python::list pylist;
typedef python::dict pydict;
typedef python::object pyobject;
typedef python::tuple pytuple;

class CoordinateServicePython : public CoordinateTransformService {
public:
	CoordinateServicePython();
	pytuple transform_point( const wstring& source, const wstring& target, const pyobject& pt );
	pylist transform_batch( const wstring& source, const wstring& target, const pylist& pts );
	wstring local_zone( const wstring& source, const pylist& pts );
	pylist populate( const pylist& points );
	pydict cache_stats() const;
	void set_params( const pydict& params );
	pydict get_params() const;
};

pylist select_polygon_python( CoordinateServicePython& service, const pylist& points, const pylist& vertices );
pylist select_rectangle_python( CoordinateServicePython& service, const pylist& points, const pyobject& first, const pyobject& second );
pylist select_polyline_python( CoordinateServicePython& service, const pylist& points, const pylist& vertices, double half_width );
pylist build_corridor_python( CoordinateServicePython& service, const pylist& vertices, double half_width );
pydict fit_line_python( CoordinateServicePython& service, const pylist& points );
pylist project_and_order_python( const pylist& points, const pydict& line );
pytuple section_extent_python( CoordinateServicePython& service, const pydict& line, const pylist& points );
pylist project_along_polyline_python( const pylist& points, const pylist& polyline, double max_offset );

#endif
