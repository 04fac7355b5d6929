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
#include "corridor.hpp"

// Added to the half width so the merged ring doesn't fall under it after union_.
static const double corridor_margin = 1e-3;

static polygon disc( const point2& c, double radius, int segments ) {
	// Circumscribed, so the sides never get closer than radius to the centre.
	double pi = geometry::math::pi<double>();
	double r = radius / std::cos( pi/segments );
	polygon out;
	for ( int i = 0; i < segments; i++ ) {
		double a = 2.0 * pi * i / segments;
		geometry::append( out, point2( gx(c) + r * std::cos(a), gy(c) + r * std::sin(a) ) );
	}
	geometry::correct( out );
	return out;
}

static polygon segment_band( const point2& a, const point2& b, double w ) {
	double dx = gx(b) - gx(a);
	double dy = gy(b) - gy(a);
	double len = std::sqrt( dx*dx + dy*dy );
	double nx = -dy/len * w;
	double ny =  dx/len * w;
	polygon out;
	geometry::append( out, point2( gx(a) - nx, gy(a) - ny ) );
	geometry::append( out, point2( gx(b) - nx, gy(b) - ny ) );
	geometry::append( out, point2( gx(b) + nx, gy(b) + ny ) );
	geometry::append( out, point2( gx(a) + nx, gy(a) + ny ) );
	geometry::correct( out );
	return out;
}

static vector<point2> remove_repeated( const vector<point2>& pts ) {
	vector<point2> out;
	for ( const point2& p: pts ) {
		if ( out.empty() or geometry::distance( out.back(), p ) > epsilon ) {
			out.push_back( p );
		}
	}
	return out;
}

polygon corridor_polygon( const vector<point2>& polyline, double half_width, int segments, bool round_ends )
{
	if ( not std::isfinite(half_width) or half_width <= 0.0 ) {
		throw GeosectionException( ErrorKind::InvalidBufferWidth, "the half width of the corridor has to be positive" );
	}
	vector<point2> pts = remove_repeated( polyline );
	if ( pts.empty() ) {
		throw GeosectionException( ErrorKind::DegenerateInput, "can't build the corridor of an empty polyline" );
	}
	double w = half_width + corridor_margin;
	if ( pts.size() == 1 ) {
		return disc( pts[0], w, segments );
	}

	vector<polygon> pieces;
	for ( size_t i = 0; i + 1 < pts.size(); i++ ) {
		pieces.push_back( segment_band( pts[i], pts[i+1], w ) );
	}
	size_t first = round_ends ? 0 : 1;
	size_t last = round_ends ? pts.size() : pts.size() - 1;
	for ( size_t i = first; i < last; i++ ) {
		pieces.push_back( disc( pts[i], w, segments ) );
	}

	multi_polygon merged;
	merged.push_back( pieces[0] );
	for ( size_t i = 1; i < pieces.size(); i++ ) {
		multi_polygon next;
		geometry::union_( merged, pieces[i], next );
		merged = next;
	}

	if ( merged.empty() ) {
		throw GeosectionException( ErrorKind::DegenerateInput, "the corridor of the polyline is empty" );
	}
	size_t largest = 0;
	double largest_area = -1.0;
	for ( size_t i = 0; i < merged.size(); i++ ) {
		double a = geometry::area( merged[i] );
		if ( a > largest_area ) {
			largest_area = a;
			largest = i;
		}
	}

	// Holes left by a polyline that loops back are filled.
	polygon out;
	out.outer() = merged[largest].outer();

	geometry::validity_failure_type failure;
	if ( not geometry::is_valid( out, failure ) and geosection_verbose ) {
		std::wcerr << L"corridor polygon is not valid, reason is: " << human_failure_type( failure ) << L"\n";
	}
	return out;
}

BufferPolygon build_corridor( CoordinateTransformService& service, const vector<LatLon>& polyline, double half_width_meters, bool round_ends )
{
	if ( not std::isfinite(half_width_meters) or half_width_meters <= 0.0 ) {
		throw GeosectionException( ErrorKind::InvalidBufferWidth, "the half width of the corridor has to be positive" );
	}
	if ( polyline.empty() ) {
		throw GeosectionException( ErrorKind::DegenerateInput, "can't build the corridor of an empty polyline" );
	}

	vector<point2> geo;
	for ( const LatLon& v: polyline ) {
		if ( not finite_point( v.lon, v.lat ) or std::abs(v.lat) > 90.0 or std::abs(v.lon) > 180.0 ) {
			throw GeosectionException( ErrorKind::InvalidCoordinate, "polyline vertex out of range" );
		}
		geo.push_back( point2( v.lon, v.lat ) );
	}
	UtmZone zone = service.local_zone( CoordinateSystem::Geographic, geo );
	vector<TransformResult> local = service.transform_batch( CoordinateSystem::Geographic, zone, geo );

	vector<point2> pts;
	for ( const TransformResult& r: local ) {
		if ( not r.ok ) {
			throw GeosectionException( r.error, r.message );
		}
		pts.push_back( r.point );
	}

	polygon poly = corridor_polygon( pts, half_width_meters, service.params().circle_segments, round_ends );

	BufferPolygon out;
	for ( const point2& p: poly.outer() ) {
		point2 g = service.transform_point( zone, CoordinateSystem::Geographic, gx(p), gy(p) );
		out.vertices.push_back( LatLon( gy(g), gx(g) ) );
	}
	if ( not out.vertices.empty() ) {
		out.vertices.push_back( out.vertices.front() );
	}
	return out;
}
