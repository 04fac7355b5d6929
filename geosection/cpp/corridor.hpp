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
#ifndef GEOSECTION_CORRIDOR_HPP
#define GEOSECTION_CORRIDOR_HPP
#include "basic.hpp"
#include "shapes.hpp"
#include "coordinates.hpp"

// Polygon of the points within half_width of the polyline, in metric coordinates.
// The ends are cut flat, or round with round_ends, and the joints are round, approximated
// by a polygon of segments sides that circumscribes the circle. A single point gives the disc.
// The ring keeps a millimetre over half_width.
polygon corridor_polygon( const vector<point2>& polyline, double half_width, int segments, bool round_ends = false );

// Builds the corridor of a polyline given in WGS84 with a width in meters.
// It's computed in the UTM zone of the polyline's centroid and returned as a closed ring.
// Throws InvalidBufferWidth, DegenerateInput for an empty polyline, and the errors of the transformations.
BufferPolygon build_corridor( CoordinateTransformService& service, const vector<LatLon>& polyline, double half_width_meters, bool round_ends = false );

#endif
