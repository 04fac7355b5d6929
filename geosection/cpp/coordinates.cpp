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
#include "coordinates.hpp"
#include <boost/geometry/srs/projection.hpp>
#include <sstream>
#include <algorithm>

// Published extent of the national grid.
static const double grid_max_easting = 800000.0;
static const double grid_max_northing = 1400000.0;
static const double mercator_limit = 20037508.3427892;

// Cache precision, about a centimetre on the ground.
static const double metric_precision = 0.01;
static const double degree_precision = 1e-7;

const char * system_name( CoordinateSystem system )
{
	switch ( system ) {
		case CoordinateSystem::NationalGrid:
			return "NationalGrid";
		case CoordinateSystem::Geographic:
			return "Geographic";
		case CoordinateSystem::LocalProjected:
			return "LocalProjected";
		case CoordinateSystem::WebMercator:
			return "WebMercator";
		default:
			return "Unknown";
	}
}

UtmZone UtmZone::from_lon_lat( double lon, double lat )
{
	int number = int(std::floor((lon + 180.0)/6.0)) + 1;
	number = std::max(1, std::min(60, number));
	return UtmZone( number, lat < 0.0 );
}

bool Frame::operator==( const Frame& o ) const
{
	if ( this->system != o.system ) {
		return false;
	}
	if ( this->system != CoordinateSystem::LocalProjected ) {
		return true;
	}
	return this->zone == o.zone;
}

Frame frame_from_name( const wstring& name )
{
	if ( name == L"NationalGrid" ) {
		return Frame( CoordinateSystem::NationalGrid );
	} else if ( name == L"Geographic" ) {
		return Frame( CoordinateSystem::Geographic );
	} else if ( name == L"WebMercator" ) {
		return Frame( CoordinateSystem::WebMercator );
	} else if ( name == L"LocalProjected" ) {
		return Frame( CoordinateSystem::LocalProjected );
	}
	// UTM<number><N|S>
	if ( name.size() >= 5 and name.size() <= 6 and name.compare( 0, 3, L"UTM" ) == 0 ) {
		wchar_t hemisphere = name[name.size()-1];
		wstring digits = name.substr( 3, name.size() - 4 );
		bool numeric = true;
		for ( wchar_t c: digits ) {
			numeric = numeric and c >= L'0' and c <= L'9';
		}
		if ( numeric and (hemisphere == L'N' or hemisphere == L'S') ) {
			int number = std::stoi( digits );
			if ( number >= 1 and number <= 60 ) {
				return Frame( UtmZone( number, hemisphere == L'S' ) );
			}
		}
	}
	throw GeosectionException( ErrorKind::TransformFailure, "unsupported coordinate system " + string( name.begin(), name.end() ) );
}

wstring zone_name( const UtmZone& zone )
{
	return L"UTM" + std::to_wstring( zone.number ) + (zone.south ? L"S" : L"N");
}

static int zone_code( const Frame& f ) {
	if ( not f.zone ) {
		return 0;
	}
	return f.zone->number * 2 + (f.zone->south ? 1 : 0);
}

static string definition( const Frame& f ) {
	switch ( f.system ) {
		case CoordinateSystem::NationalGrid:
			return "+proj=tmerc +lat_0=49 +lon_0=-2 +k=0.9996012717 +x_0=400000 +y_0=-100000 +ellps=airy "
			       "+towgs84=446.448,-125.157,542.06,0.15,0.247,0.842,-20.489 +units=m +no_defs";
		case CoordinateSystem::Geographic:
			return "+proj=longlat +datum=WGS84 +no_defs";
		case CoordinateSystem::WebMercator:
			return "+proj=merc +a=6378137 +b=6378137 +lat_ts=0 +lon_0=0 +x_0=0 +y_0=0 +k=1 +units=m +no_defs";
		case CoordinateSystem::LocalProjected:
		{
			std::ostringstream os;
			os << "+proj=utm +zone=" << f.zone->number;
			if ( f.zone->south ) {
				os << " +south";
			}
			os << " +datum=WGS84 +units=m +no_defs";
			return os.str();
		}
		default:
			throw GeosectionException( ErrorKind::TransformFailure, "unsupported coordinate system" );
	}
}

static string describe( double x, double y ) {
	std::ostringstream os;
	os << "(" << x << ", " << y << ")";
	return os.str();
}

static void check_input( const Frame& f, double x, double y ) {
	if ( not finite_point(x, y) ) {
		throw GeosectionException( ErrorKind::InvalidCoordinate, "non finite coordinate " + describe(x, y) );
	}
	switch ( f.system ) {
		case CoordinateSystem::Geographic:
			if ( x < -180.0 or x > 180.0 or y < -90.0 or y > 90.0 ) {
				throw GeosectionException( ErrorKind::InvalidCoordinate, "longitude or latitude out of range " + describe(x, y) );
			}
			break;
		case CoordinateSystem::NationalGrid:
			if ( x < 0.0 or x > grid_max_easting or y < 0.0 or y > grid_max_northing ) {
				throw GeosectionException( ErrorKind::InvalidCoordinate, "national grid coordinate out of range " + describe(x, y) );
			}
			break;
		case CoordinateSystem::WebMercator:
			if ( std::abs(x) > mercator_limit or std::abs(y) > mercator_limit ) {
				throw GeosectionException( ErrorKind::InvalidCoordinate, "web mercator coordinate out of range " + describe(x, y) );
			}
			break;
		case CoordinateSystem::LocalProjected:
			if ( not f.zone ) {
				throw GeosectionException( ErrorKind::TransformFailure, "local projected source without zone" );
			}
			break;
	}
}

CoordinateTransformService::CoordinateTransformService(): cache(parameters.cache_capacity), hits(0), misses(0), errors(0)
{
}

CoordinateTransformService::CoordinateTransformService( const Params& params ): parameters(params), cache(params.cache_capacity),
										hits(0), misses(0), errors(0)
{
}

std::shared_ptr<CoordinateTransformService::transformation> CoordinateTransformService::transformer( const Frame& source, const Frame& target )
{
	auto key = std::make_pair( definition(source), definition(target) );
	std::lock_guard<std::mutex> guard(this->transformers_lock);
	auto it = this->transformers.find( key );
	if ( it != this->transformers.end() ) {
		return it->second;
	}
	std::shared_ptr<transformation> t;
	try {
		t = std::make_shared<transformation>( geometry::srs::proj4(key.first), geometry::srs::proj4(key.second) );
	} catch ( const geometry::projection_exception& e ) {
		throw GeosectionException( ErrorKind::TransformFailure, string("can't build transformation: ") + e.what() );
	}
	this->transformers[key] = t;
	return t;
}

point2 CoordinateTransformService::convert( const Frame& source, const Frame& target, double x, double y )
{
	double q = source.system == CoordinateSystem::Geographic ? degree_precision : metric_precision;
	cache_key key = std::make_tuple( int(source.system), zone_code(source), int(target.system), zone_code(target),
					 std::llround(x/q), std::llround(y/q) );
	point2 out;
	if ( this->cache.get( key, out ) ) {
		this->hits++;
		return out;
	}
	this->misses++;

	const double d2r = geometry::math::d2r<double>();
	point2 in( x, y );
	if ( source.system == CoordinateSystem::Geographic ) {
		in = point2( x*d2r, y*d2r );
	}
	bool ok;
	try {
		ok = this->transformer( source, target )->forward( in, out );
	} catch ( const geometry::projection_exception& e ) {
		throw GeosectionException( ErrorKind::TransformFailure, string("projection failed: ") + e.what() );
	}
	if ( not ok ) {
		throw GeosectionException( ErrorKind::TransformFailure, string("can't transform ") + describe(x, y) +
					   " from " + system_name(source.system) + " to " + system_name(target.system) );
	}
	if ( target.system == CoordinateSystem::Geographic ) {
		out = point2( gx(out)/d2r, gy(out)/d2r );
	}
	this->cache.put( key, out );
	return out;
}

point2 CoordinateTransformService::transform_checked( const Frame& source, const Frame& target, double x, double y )
{
	check_input( source, x, y );
	Frame dst = target;
	if ( dst.system == CoordinateSystem::LocalProjected and not dst.zone ) {
		if ( source.system == CoordinateSystem::Geographic ) {
			dst.zone = UtmZone::from_lon_lat( x, y );
		} else {
			point2 geo = this->transform_checked( source, CoordinateSystem::Geographic, x, y );
			dst.zone = UtmZone::from_lon_lat( gx(geo), gy(geo) );
		}
	}
	if ( source == dst ) {
		return point2( x, y );
	}

	point2 out = this->convert( source, dst, x, y );
	if ( not finite_point( gx(out), gy(out) ) ) {
		throw GeosectionException( ErrorKind::TransformFailure, "transformation of " + describe(x, y) + " is not finite" );
	}
	if ( dst.system == CoordinateSystem::Geographic and
	     ( gx(out) < -180.0 or gx(out) > 180.0 or gy(out) < -90.0 or gy(out) > 90.0 ) ) {
		throw GeosectionException( ErrorKind::InvalidCoordinate, "transformed coordinate out of range " + describe(gx(out), gy(out)) );
	}
	return out;
}

TransformResult CoordinateTransformService::try_transform( const Frame& source, const Frame& target, double x, double y )
{
	TransformResult r;
	try {
		r.point = this->transform_checked( source, target, x, y );
		r.ok = true;
	} catch ( const GeosectionException& e ) {
		this->errors++;
		r.error = e.kind();
		r.message = e.detail();
		if ( geosection_verbose ) {
			std::wcerr << L"transformation failed: " << e.what() << L"\n";
		}
	}
	return r;
}

point2 CoordinateTransformService::transform_point( const Frame& source, const Frame& target, double x, double y )
{
	try {
		return this->transform_checked( source, target, x, y );
	} catch ( const GeosectionException& ) {
		this->errors++;
		throw;
	}
}

UtmZone CoordinateTransformService::local_zone( const Frame& source, const vector<point2>& pts )
{
	double slon = 0.0;
	double slat = 0.0;
	size_t n = 0;
	for ( const point2& p: pts ) {
		TransformResult r = this->try_transform( source, CoordinateSystem::Geographic, gx(p), gy(p) );
		if ( r.ok ) {
			slon += gx(r.point);
			slat += gy(r.point);
			n++;
		}
	}
	if ( n == 0 ) {
		throw GeosectionException( ErrorKind::TransformFailure, "can't find a local zone, no point could be located" );
	}
	return UtmZone::from_lon_lat( slon/n, slat/n );
}

vector<TransformResult> CoordinateTransformService::transform_batch( const Frame& source, const Frame& target, const vector<point2>& pts )
{
	vector<TransformResult> out;
	out.reserve( pts.size() );
	Frame dst = target;
	if ( dst.system == CoordinateSystem::LocalProjected and not dst.zone ) {
		try {
			dst.zone = this->local_zone( source, pts );
		} catch ( const GeosectionException& ) {
			// No point can be located, report each one.
			for ( size_t i = 0; i < pts.size(); i++ ) {
				out.push_back( this->try_transform( source, CoordinateSystem::Geographic, gx(pts[i]), gy(pts[i]) ) );
			}
			return out;
		}
	}
	for ( const point2& p: pts ) {
		out.push_back( this->try_transform( source, dst, gx(p), gy(p) ) );
	}
	return out;
}

optional<UtmZone> CoordinateTransformService::populate( vector<SurveyPoint>& points )
{
	double slon = 0.0;
	double slat = 0.0;
	size_t n = 0;
	for ( SurveyPoint& p: points ) {
		if ( not p.has_geo() ) {
			TransformResult r = this->try_transform( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, p.grid_x, p.grid_y );
			if ( not r.ok ) {
				if ( geosection_verbose ) {
					std::wcerr << L"can't locate point " << p.id << L"\n";
				}
				continue;
			}
			p.geo_lon = gx(r.point);
			p.geo_lat = gy(r.point);
		}
		slon += *p.geo_lon;
		slat += *p.geo_lat;
		n++;
	}
	if ( n == 0 ) {
		return optional<UtmZone>();
	}

	UtmZone zone = UtmZone::from_lon_lat( slon/n, slat/n );
	for ( SurveyPoint& p: points ) {
		if ( p.has_proj() or not p.has_geo() ) {
			continue;
		}
		TransformResult r = this->try_transform( CoordinateSystem::Geographic, zone, *p.geo_lon, *p.geo_lat );
		if ( r.ok ) {
			p.proj_x = gx(r.point);
			p.proj_y = gy(r.point);
		} else if ( geosection_verbose ) {
			std::wcerr << L"can't project point " << p.id << L"\n";
		}
	}
	return zone;
}

CacheStats CoordinateTransformService::cache_stats() const
{
	CacheStats s;
	s.hits = this->hits;
	s.misses = this->misses;
	s.errors = this->errors;
	s.size = this->cache.size();
	s.capacity = this->cache.capacity();
	return s;
}

void CoordinateTransformService::clear_cache()
{
	this->cache.clear();
	this->hits = 0;
	this->misses = 0;
	this->errors = 0;
	if ( geosection_verbose ) {
		std::wcerr << L"coordinate cache cleared\n";
	}
}

Params CoordinateTransformService::params() const
{
	std::lock_guard<std::mutex> guard(this->parameters_lock);
	return this->parameters;
}

void CoordinateTransformService::set_params( const map<wstring, wstring>& params )
{
	std::lock_guard<std::mutex> guard(this->parameters_lock);
	this->parameters.update( params );
	this->cache.set_capacity( this->parameters.cache_capacity );
}
