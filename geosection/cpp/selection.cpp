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
#include "selection.hpp"
#include "corridor.hpp"

Polygon::Polygon( const vector<point2>& vertices )
{
	for ( const point2& p: vertices ) {
		if ( this->nodes.empty() or not geometry::equals( this->nodes.back(), p ) ) {
			this->nodes.push_back( p );
		}
	}
	// Closed rings are opened.
	while ( this->nodes.size() > 1 and geometry::equals( this->nodes.front(), this->nodes.back() ) ) {
		this->nodes.pop_back();
	}
	geometry::assign_inverse( this->bbox );
	for ( const point2& p: this->nodes ) {
		geometry::expand( this->bbox, p );
	}
}

bool Polygon::valid() const
{
	if ( this->nodes.size() < 3 ) {
		return false;
	}
	for ( const point2& p: this->nodes ) {
		if ( not finite_point( gx(p), gy(p) ) ) {
			return false;
		}
	}
	return true;
}

const box& Polygon::envelope() const
{
	return this->bbox;
}

bool Polygon::contains( const point2& pt ) const
{
	if ( not this->valid() or not geometry::covered_by( pt, this->bbox ) ) {
		return false;
	}
	double x = gx(pt);
	double y = gy(pt);
	bool inside = false;
	size_t n = this->nodes.size();
	for ( size_t i = 0, j = n - 1; i < n; j = i++ ) {
		double xi = gx(this->nodes[i]);
		double yi = gy(this->nodes[i]);
		double xj = gx(this->nodes[j]);
		double yj = gy(this->nodes[j]);
		// Half open in y, so a vertex is counted once.
		if ( (yi > y) != (yj > y) ) {
			double xc = xi + (y - yi) * (xj - xi) / (yj - yi);
			if ( x < xc ) {
				inside = not inside;
			}
		}
	}
	return inside;
}

class shape_selector : public static_visitor<vector<wstring>> {
	SpatialFilter& filter;
	const vector<SurveyPoint>& points;
public:
	shape_selector( SpatialFilter& filter, const vector<SurveyPoint>& points ): filter(filter), points(points) {
	}
	vector<wstring> operator()( const PolygonShape& s ) const {
		return this->filter.select_polygon( this->points, s );
	}
	vector<wstring> operator()( const RectangleShape& s ) const {
		return this->filter.select_rectangle( this->points, s );
	}
	vector<wstring> operator()( const PolylineShape& s ) const {
		return this->filter.select_polyline( this->points, s );
	}
};

SpatialFilter::SpatialFilter( CoordinateTransformService& service ): service(service)
{
}

vector<optional<point2>> SpatialFilter::locate( const vector<SurveyPoint>& points )
{
	vector<optional<point2>> out( points.size() );
	vector<point2> missing;
	vector<size_t> missing_idx;
	for ( size_t i = 0; i < points.size(); i++ ) {
		const SurveyPoint& p = points[i];
		if ( p.has_geo() ) {
			out[i] = point2( *p.geo_lon, *p.geo_lat );
		} else {
			missing.push_back( point2( p.grid_x, p.grid_y ) );
			missing_idx.push_back( i );
		}
	}
	if ( missing.empty() ) {
		return out;
	}
	vector<TransformResult> located = this->service.transform_batch( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, missing );
	for ( size_t k = 0; k < located.size(); k++ ) {
		if ( located[k].ok ) {
			out[missing_idx[k]] = located[k].point;
		} else if ( geosection_verbose ) {
			std::wcerr << L"point " << points[missing_idx[k]].id << L" skipped, it can't be located\n";
		}
	}
	return out;
}

vector<wstring> SpatialFilter::select_inside( const vector<SurveyPoint>& points, const Polygon& poly )
{
	vector<wstring> out;
	if ( not poly.valid() ) {
		return out;
	}
	vector<optional<point2>> located = this->locate( points );
	for ( size_t i = 0; i < points.size(); i++ ) {
		if ( located[i] and poly.contains( *located[i] ) ) {
			out.push_back( points[i].id );
		}
	}
	return out;
}

vector<wstring> SpatialFilter::select_points_in_shape( const vector<SurveyPoint>& points, const ShapeDescriptor& shape )
{
	shape_selector selector( *this, points );
	return apply_visitor( selector, shape );
}

vector<wstring> SpatialFilter::select_polygon( const vector<SurveyPoint>& points, const PolygonShape& shape )
{
	vector<point2> vertices;
	for ( const LatLon& v: shape.vertices ) {
		vertices.push_back( point2( v.lon, v.lat ) );
	}
	return this->select_inside( points, Polygon( vertices ) );
}

vector<wstring> SpatialFilter::select_rectangle( const vector<SurveyPoint>& points, const RectangleShape& shape )
{
	vector<wstring> out;
	if ( not finite_point( shape.first.lon, shape.first.lat ) or not finite_point( shape.second.lon, shape.second.lat ) ) {
		return out;
	}
	double min_lat = std::min( shape.first.lat, shape.second.lat );
	double max_lat = std::max( shape.first.lat, shape.second.lat );
	double min_lon = std::min( shape.first.lon, shape.second.lon );
	double max_lon = std::max( shape.first.lon, shape.second.lon );

	vector<optional<point2>> located = this->locate( points );
	for ( size_t i = 0; i < points.size(); i++ ) {
		if ( not located[i] ) {
			continue;
		}
		double lon = gx(*located[i]);
		double lat = gy(*located[i]);
		if ( lat >= min_lat and lat <= max_lat and lon >= min_lon and lon <= max_lon ) {
			out.push_back( points[i].id );
		}
	}
	return out;
}

vector<wstring> SpatialFilter::select_polyline( const vector<SurveyPoint>& points, const PolylineShape& shape )
{
	BufferPolygon corridor;
	try {
		// Round ends, so boreholes at the ends of the polyline are selected.
		corridor = build_corridor( this->service, shape.vertices, shape.half_width_meters, true );
	} catch ( const GeosectionException& e ) {
		if ( geosection_verbose ) {
			std::wcerr << L"polyline selects nothing: " << e.what() << L"\n";
		}
		return vector<wstring>();
	}
	vector<point2> vertices;
	for ( const LatLon& v: corridor.vertices ) {
		vertices.push_back( point2( v.lon, v.lat ) );
	}
	return this->select_inside( points, Polygon( vertices ) );
}
