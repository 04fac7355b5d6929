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
#include <boost/python/args.hpp>
#include "geosection.hpp"

PyObject *GeosectionExceptionType = NULL;

PyObject* createExceptionClass(const char* name, PyObject* baseTypeObj = PyExc_Exception)
{
	using std::string;
	namespace bp = boost::python;

	string scopeName = bp::extract<string>(bp::scope().attr("__name__"));
	string qualifiedName0 = scopeName + "." + name;
	char* qualifiedName1 = const_cast<char*>(qualifiedName0.c_str());

	PyObject* typeObj = PyErr_NewException(qualifiedName1, baseTypeObj, 0);
	if(!typeObj) bp::throw_error_already_set();
	bp::scope().attr(name) = bp::handle<>(bp::borrowed(typeObj));
	return typeObj;
}

void translate(GeosectionException const& e)
{
	// Use the Python 'C' API to set up an exception object
	PyErr_SetString(GeosectionExceptionType, e.what());
}

void set_verbose( bool verbose ) {
	geosection_verbose = verbose;
}

static optional<double> optional_field( const pydict& d, const char * key ) {
	pyobject v = d.get( key );
	if ( v.is_none() ) {
		return optional<double>();
	}
	double value = python::extract<double>( v );
	return optional<double>( value );
}

// Points come as dicts with id, grid_x, grid_y and optionally geo_lat, geo_lon, proj_x and proj_y.
static vector<SurveyPoint> survey_points( const pylist& points ) {
	vector<SurveyPoint> out;
	for ( int i = 0; i < python::len( points ); i++ ) {
		pydict d = python::extract<pydict>( points[i] );
		SurveyPoint p( ( python::extract<wstring>( d["id"] ) ), python::extract<double>( d["grid_x"] ), python::extract<double>( d["grid_y"] ) );
		p.geo_lat = optional_field( d, "geo_lat" );
		p.geo_lon = optional_field( d, "geo_lon" );
		p.proj_x = optional_field( d, "proj_x" );
		p.proj_y = optional_field( d, "proj_y" );
		out.push_back( p );
	}
	return out;
}

// Vertices come as (lat, lon) pairs.
static vector<LatLon> latlon_vertices( const pylist& vertices ) {
	vector<LatLon> out;
	for ( int i = 0; i < python::len( vertices ); i++ ) {
		out.push_back( LatLon( python::extract<double>( vertices[i][0] ), python::extract<double>( vertices[i][1] ) ) );
	}
	return out;
}

static vector<point2> xy_points( const pylist& pts ) {
	vector<point2> out;
	for ( int i = 0; i < python::len( pts ); i++ ) {
		out.push_back( point2( python::extract<double>( pts[i][0] ), python::extract<double>( pts[i][1] ) ) );
	}
	return out;
}

static pylist ids_to_pylist( const vector<wstring>& ids ) {
	pylist out;
	for ( const wstring& id: ids ) {
		out.append( id );
	}
	return out;
}

static SectionLine section_line( const pydict& d ) {
	SectionLine l;
	l.origin_x = python::extract<double>( d["origin_x"] );
	l.origin_y = python::extract<double>( d["origin_y"] );
	l.direction_x = python::extract<double>( d["direction_x"] );
	l.direction_y = python::extract<double>( d["direction_y"] );
	return l;
}

CoordinateServicePython::CoordinateServicePython(): CoordinateTransformService()
{
}

pytuple CoordinateServicePython::transform_point( const wstring& source, const wstring& target, const pyobject& pt )
{
	point2 out = CoordinateTransformService::transform_point( frame_from_name( source ), frame_from_name( target ),
								  python::extract<double>( pt[0] ), python::extract<double>( pt[1] ) );
	return python::make_tuple( gx(out), gy(out) );
}

pylist CoordinateServicePython::transform_batch( const wstring& source, const wstring& target, const pylist& pts )
{
	vector<TransformResult> res = CoordinateTransformService::transform_batch( frame_from_name( source ), frame_from_name( target ), xy_points( pts ) );
	pylist out;
	for ( const TransformResult& r: res ) {
		pydict d;
		d["ok"] = r.ok;
		if ( r.ok ) {
			d["point"] = python::make_tuple( gx(r.point), gy(r.point) );
			d["error"] = pyobject();
		} else {
			d["point"] = pyobject();
			d["error"] = string( error_kind_name( r.error ) ) + ": " + r.message;
		}
		out.append( d );
	}
	return out;
}

wstring CoordinateServicePython::local_zone( const wstring& source, const pylist& pts )
{
	return zone_name( CoordinateTransformService::local_zone( frame_from_name( source ), xy_points( pts ) ) );
}

pylist CoordinateServicePython::populate( const pylist& points )
{
	vector<SurveyPoint> pts = survey_points( points );
	CoordinateTransformService::populate( pts );
	pylist out;
	for ( const SurveyPoint& p: pts ) {
		pydict d;
		d["id"] = p.id;
		d["grid_x"] = p.grid_x;
		d["grid_y"] = p.grid_y;
		d["geo_lat"] = p.geo_lat ? pyobject( *p.geo_lat ) : pyobject();
		d["geo_lon"] = p.geo_lon ? pyobject( *p.geo_lon ) : pyobject();
		d["proj_x"] = p.proj_x ? pyobject( *p.proj_x ) : pyobject();
		d["proj_y"] = p.proj_y ? pyobject( *p.proj_y ) : pyobject();
		out.append( d );
	}
	return out;
}

pydict CoordinateServicePython::cache_stats() const
{
	CacheStats s = CoordinateTransformService::cache_stats();
	unsigned long total = s.hits + s.misses + s.errors;
	pydict out;
	out["hits"] = s.hits;
	out["misses"] = s.misses;
	out["errors"] = s.errors;
	out["size"] = s.size;
	out["capacity"] = s.capacity;
	out["total_requests"] = total;
	out["hit_rate"] = total > 0 ? double(s.hits)/total : 0.0;
	out["error_rate"] = total > 0 ? double(s.errors)/total : 0.0;
	return out;
}

void CoordinateServicePython::set_params( const pydict& params )
{
	map<wstring, wstring> local_params;
	pylist keys = params.keys();
	for ( int i = 0; i < python::len( keys ); i++ ) {
		local_params[python::extract<wstring>(keys[i])] = python::extract<wstring>(python::str(params[keys[i]]));
	}
	CoordinateTransformService::set_params( local_params );
}

pydict CoordinateServicePython::get_params() const
{
	pydict out;
	for ( auto& kv: this->params().as_map() ) {
		out[kv.first] = kv.second;
	}
	return out;
}

pylist select_polygon_python( CoordinateServicePython& service, const pylist& points, const pylist& vertices )
{
	PolygonShape shape;
	shape.vertices = latlon_vertices( vertices );
	SpatialFilter filter( service );
	return ids_to_pylist( filter.select_points_in_shape( survey_points( points ), shape ) );
}

pylist select_rectangle_python( CoordinateServicePython& service, const pylist& points, const pyobject& first, const pyobject& second )
{
	RectangleShape shape;
	shape.first = LatLon( python::extract<double>( first[0] ), python::extract<double>( first[1] ) );
	shape.second = LatLon( python::extract<double>( second[0] ), python::extract<double>( second[1] ) );
	SpatialFilter filter( service );
	return ids_to_pylist( filter.select_points_in_shape( survey_points( points ), shape ) );
}

pylist select_polyline_python( CoordinateServicePython& service, const pylist& points, const pylist& vertices, double half_width )
{
	PolylineShape shape;
	shape.vertices = latlon_vertices( vertices );
	shape.half_width_meters = half_width;
	SpatialFilter filter( service );
	return ids_to_pylist( filter.select_points_in_shape( survey_points( points ), shape ) );
}

pylist build_corridor_python( CoordinateServicePython& service, const pylist& vertices, double half_width )
{
	BufferPolygon corridor = build_corridor( service, latlon_vertices( vertices ), half_width );
	pylist out;
	for ( const LatLon& v: corridor.vertices ) {
		out.append( python::make_tuple( v.lat, v.lon ) );
	}
	return out;
}

pydict fit_line_python( CoordinateServicePython& service, const pylist& points )
{
	SectionLine l = fit_line( xy_points( points ), service.params().fit_tolerance );
	pydict out;
	out["origin_x"] = l.origin_x;
	out["origin_y"] = l.origin_y;
	out["direction_x"] = l.direction_x;
	out["direction_y"] = l.direction_y;
	return out;
}

pylist project_and_order_python( const pylist& points, const pydict& line )
{
	vector<Projection> res = project_and_order( survey_points( points ), section_line( line ) );
	pylist out;
	for ( const Projection& p: res ) {
		out.append( python::make_tuple( p.point_id, p.distance_along_line, p.perpendicular_offset ) );
	}
	return out;
}

pytuple section_extent_python( CoordinateServicePython& service, const pydict& line, const pylist& points )
{
	std::pair<point2, point2> ends = section_extent( section_line( line ), survey_points( points ), service.params().section_extension );
	return python::make_tuple( python::make_tuple( gx(ends.first), gy(ends.first) ),
				   python::make_tuple( gx(ends.second), gy(ends.second) ) );
}

pylist project_along_polyline_python( const pylist& points, const pylist& polyline, double max_offset )
{
	vector<PolylineProjection> res = project_along_polyline( survey_points( points ), xy_points( polyline ), max_offset );
	pylist out;
	for ( const PolylineProjection& p: res ) {
		out.append( python::make_tuple( p.point_id, p.distance_along_polyline, p.distance_to_polyline ) );
	}
	return out;
}

BOOST_PYTHON_MODULE(cpp)
{
	const char* doc_verb =	"Sets the operations as verbose.\n\n"
				"When set, geosection tells the user about skipped points, failed\n"
				"transformations and non valid corridors.\n\n"
				"Args:\n"
				"    (boolean) verbose:\n"
				"    if geosection should be verbose.\n";

	const char* doc_transform_point = "Transforms a point between two coordinate systems.\n\n"
					  "Args:\n"
					  "    (string) source: NationalGrid, Geographic, WebMercator or a zone like UTM30N.\n"
					  "    (string) target: same as source, LocalProjected takes the zone of the point.\n"
					  "    (tuple) point: x and y, longitude and latitude for Geographic.\n"
					  "Returns:\n"
					  "    (tuple): the transformed point.\n";

	const char* doc_transform_batch = "Transforms a list of points to a single frame.\n\n"
					  "LocalProjected takes the zone of the centroid of the points.\n"
					  "Returns:\n"
					  "    (list): one dict per point with ok, point and error.\n";

	const char* doc_select =	"Returns the ids of the points inside the shape, in the order of the points.\n\n"
					"Points are dicts with id, grid_x, grid_y and optionally geo_lat and geo_lon.\n"
					"Vertices are (lat, lon) pairs. A degenerate shape selects nothing.\n";

	const char* doc_corridor =	"Builds the corridor of a polyline.\n\n"
					"Args:\n"
					"    (list) vertices: (lat, lon) pairs.\n"
					"    (double) half_width: distance in meters from the polyline to the border.\n"
					"Returns:\n"
					"    (list): the closed ring of the corridor as (lat, lon) pairs.\n";

	const char* doc_fit_line =	"Finds the principal axis through a list of (x, y) projected points.\n\n"
					"Returns:\n"
					"    (dict): origin_x, origin_y, direction_x and direction_y.\n";

	const char* doc_project =	"Projects the points on the section line, sorted by distance along it.\n\n"
					"Returns:\n"
					"    (list): (id, distance_along_line, perpendicular_offset) tuples.\n";

	// Register exception.
	python::class_<GeosectionException> GeosectionExceptionClass("GeosectionException", python::no_init);

	GeosectionExceptionType = createExceptionClass("GeosectionException");

	python::register_exception_translator<GeosectionException>(&translate);

	python::def("set_verbose", set_verbose, python::args("verbose"), doc_verb);

	python::class_<CoordinateServicePython, boost::noncopyable>("CoordinateService", python::init<>())
		.def("transform_point", &CoordinateServicePython::transform_point, python::args("source", "target", "point"), doc_transform_point)
		.def("transform_batch", &CoordinateServicePython::transform_batch, python::args("source", "target", "points"), doc_transform_batch)
		.def("local_zone", &CoordinateServicePython::local_zone, python::args("source", "points"))
		.def("populate", &CoordinateServicePython::populate, python::args("points"))
		.def("cache_stats", &CoordinateServicePython::cache_stats)
		.def("clear_cache", &CoordinateServicePython::clear_cache)
		.def("set_params", &CoordinateServicePython::set_params, python::args("params"))
		.def("get_params", &CoordinateServicePython::get_params);

	python::def("select_polygon", select_polygon_python, python::args("service", "points", "vertices"), doc_select);
	python::def("select_rectangle", select_rectangle_python, python::args("service", "points", "first", "second"), doc_select);
	python::def("select_polyline", select_polyline_python, python::args("service", "points", "vertices", "half_width"), doc_select);
	python::def("build_corridor", build_corridor_python, python::args("service", "vertices", "half_width"), doc_corridor);
	python::def("fit_line", fit_line_python, python::args("service", "points"), doc_fit_line);
	python::def("project_and_order", project_and_order_python, python::args("points", "line"), doc_project);
	python::def("section_extent", section_extent_python, python::args("service", "line", "points"));
	python::def("project_along_polyline", project_along_polyline_python, python::args("points", "polyline", "max_offset"));
}
