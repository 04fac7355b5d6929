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
#include "section.hpp"
#include <algorithm>

SectionLine fit_line( const vector<point2>& points, double tol )
{
	size_t n = points.size();
	if ( n < 2 ) {
		throw GeosectionException( ErrorKind::DegenerateInput, "a section line needs at least two distinct points" );
	}
	double cx = 0.0;
	double cy = 0.0;
	for ( const point2& p: points ) {
		if ( not finite_point( gx(p), gy(p) ) ) {
			throw GeosectionException( ErrorKind::InvalidCoordinate, "non finite point in section line" );
		}
		cx += gx(p);
		cy += gy(p);
	}
	cx /= n;
	cy /= n;

	double sxx = 0.0;
	double syy = 0.0;
	double sxy = 0.0;
	for ( const point2& p: points ) {
		double dx = gx(p) - cx;
		double dy = gy(p) - cy;
		sxx += dx * dx;
		syy += dy * dy;
		sxy += dx * dy;
	}
	sxx /= n;
	syy /= n;
	sxy /= n;

	// Largest eigenvalue of the covariance.
	double hd = 0.5 * (sxx - syy);
	double lambda = 0.5 * (sxx + syy) + std::sqrt( hd * hd + sxy * sxy );
	if ( lambda <= tol * tol ) {
		throw GeosectionException( ErrorKind::DegenerateInput, "a section line needs at least two distinct points" );
	}

	double ax = lambda - syy;
	double ay = sxy;
	double bx = sxy;
	double by = lambda - sxx;
	double na = std::sqrt( ax * ax + ay * ay );
	double nb = std::sqrt( bx * bx + by * by );

	SectionLine line;
	line.origin_x = cx;
	line.origin_y = cy;
	if ( na >= nb and na > tol * tol ) {
		line.direction_x = ax / na;
		line.direction_y = ay / na;
	} else if ( nb > tol * tol ) {
		line.direction_x = bx / nb;
		line.direction_y = by / nb;
	} else {
		// Same spread in every direction.
		line.direction_x = 1.0;
		line.direction_y = 0.0;
	}
	return line;
}

static vector<point2> projected( const vector<SurveyPoint>& points ) {
	vector<point2> out;
	for ( const SurveyPoint& p: points ) {
		if ( not p.has_proj() or not finite_point( *p.proj_x, *p.proj_y ) ) {
			string id( p.id.begin(), p.id.end() );
			throw GeosectionException( ErrorKind::InvalidCoordinate, "point " + id + " has no projected coordinates" );
		}
		out.push_back( point2( *p.proj_x, *p.proj_y ) );
	}
	return out;
}

static double along( const SectionLine& line, const point2& p ) {
	return (gx(p) - line.origin_x) * line.direction_x + (gy(p) - line.origin_y) * line.direction_y;
}

static SectionLine oriented( const SectionLine& line, const vector<point2>& pts ) {
	SectionLine out = line;
	bool flip;
	double first = along( line, pts.front() );
	double last = along( line, pts.back() );
	if ( std::abs( last - first ) > epsilon ) {
		flip = first > last;
	} else if ( line.direction_x != 0.0 ) {
		flip = line.direction_x < 0.0;
	} else {
		flip = line.direction_y < 0.0;
	}
	if ( flip ) {
		out.direction_x = -line.direction_x;
		out.direction_y = -line.direction_y;
	}
	return out;
}

vector<Projection> project_and_order( const vector<SurveyPoint>& points, const SectionLine& line )
{
	vector<Projection> out;
	if ( points.empty() ) {
		return out;
	}
	vector<point2> pts = projected( points );
	SectionLine l = oriented( line, pts );

	vector<double> distances;
	vector<double> offsets;
	for ( const point2& p: pts ) {
		double vx = gx(p) - l.origin_x;
		double vy = gy(p) - l.origin_y;
		// On an epsilon grid so close points tie.
		distances.push_back( std::round( (vx * l.direction_x + vy * l.direction_y) / epsilon ) * epsilon );
		offsets.push_back( -vx * l.direction_y + vy * l.direction_x );
	}

	for ( size_t i: sort_indexes( distances ) ) {
		Projection pr;
		pr.point_id = points[i].id;
		pr.distance_along_line = distances[i];
		pr.perpendicular_offset = offsets[i];
		out.push_back( pr );
	}
	return out;
}

std::pair<point2, point2> section_extent( const SectionLine& line, const vector<SurveyPoint>& points, double extension )
{
	if ( points.empty() ) {
		throw GeosectionException( ErrorKind::DegenerateInput, "a section needs points" );
	}
	if ( not std::isfinite( extension ) or extension < 0.0 ) {
		throw GeosectionException( ErrorKind::InvalidParameter, "the section extension can't be negative" );
	}
	vector<point2> pts = projected( points );
	SectionLine l = oriented( line, pts );

	double dmin = std::numeric_limits<double>::infinity();
	double dmax = -std::numeric_limits<double>::infinity();
	for ( const point2& p: pts ) {
		double d = along( l, p );
		dmin = std::min( dmin, d );
		dmax = std::max( dmax, d );
	}
	double ext = (dmax - dmin) * extension;
	dmin -= ext;
	dmax += ext;
	return std::make_pair( point2( l.origin_x + dmin * l.direction_x, l.origin_y + dmin * l.direction_y ),
			       point2( l.origin_x + dmax * l.direction_x, l.origin_y + dmax * l.direction_y ) );
}

vector<PolylineProjection> project_along_polyline( const vector<SurveyPoint>& points, const vector<point2>& polyline, double max_offset )
{
	if ( not std::isfinite( max_offset ) or max_offset <= 0.0 ) {
		throw GeosectionException( ErrorKind::InvalidBufferWidth, "the distance to the polyline has to be positive" );
	}
	line nodes;
	for ( const point2& p: polyline ) {
		if ( not finite_point( gx(p), gy(p) ) ) {
			throw GeosectionException( ErrorKind::InvalidCoordinate, "non finite polyline vertex" );
		}
		if ( nodes.empty() or geometry::distance( nodes.back(), p ) > epsilon ) {
			nodes.push_back( p );
		}
	}
	if ( nodes.size() < 2 ) {
		throw GeosectionException( ErrorKind::DegenerateInput, "a polyline section needs at least two distinct vertices" );
	}

	// Chainage at the start of every segment.
	vector<double> starts( 1, 0.0 );
	for ( size_t i = 1; i + 1 < nodes.size(); i++ ) {
		starts.push_back( starts.back() + geometry::distance( nodes[i-1], nodes[i] ) );
	}

	vector<point2> pts = projected( points );
	vector<PolylineProjection> kept;
	vector<double> chainages;
	for ( size_t k = 0; k < pts.size(); k++ ) {
		double best = std::numeric_limits<double>::infinity();
		double chainage = 0.0;
		for ( size_t i = 0; i + 1 < nodes.size(); i++ ) {
			std::tuple<point2, double> closest = point_segment_projection( pts[k], nodes[i], nodes[i+1] );
			// The first segment wins ties, as the chainage is smaller there.
			if ( g1(closest) < best ) {
				best = g1(closest);
				chainage = starts[i] + geometry::distance( nodes[i], g0(closest) );
			}
		}
		double dist = std::sqrt( best );
		if ( dist <= max_offset ) {
			PolylineProjection pr;
			pr.point_id = points[k].id;
			pr.distance_along_polyline = chainage;
			pr.distance_to_polyline = dist;
			kept.push_back( pr );
			chainages.push_back( chainage );
		}
	}

	vector<PolylineProjection> out;
	for ( size_t i: sort_indexes( chainages ) ) {
		out.push_back( kept[i] );
	}
	return out;
}
