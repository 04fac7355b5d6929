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
#include <gtest/gtest.h>
#include <thread>

namespace {

template<class F>
ErrorKind thrown_kind( F f ) {
	try {
		f();
	} catch ( const GeosectionException& e ) {
		return e.kind();
	}
	return ErrorKind::None;
}

class CoordinatesTest : public ::testing::Test {
protected:
	CoordinateTransformService service;
};

TEST_F(CoordinatesTest, ZoneFromLonLat) {
	UtmZone z = UtmZone::from_lon_lat( -1.5, 52.0 );
	EXPECT_EQ(z.number, 30);
	EXPECT_FALSE(z.south);

	z = UtmZone::from_lon_lat( -180.0, -10.0 );
	EXPECT_EQ(z.number, 1);
	EXPECT_TRUE(z.south);

	EXPECT_EQ(UtmZone::from_lon_lat( 180.0, 0.0 ).number, 60);
	EXPECT_EQ(UtmZone::from_lon_lat( 3.0, 0.0 ).number, 31);
}

TEST_F(CoordinatesTest, FrameNames) {
	Frame f = frame_from_name( L"UTM30N" );
	EXPECT_EQ(f.system, CoordinateSystem::LocalProjected);
	ASSERT_TRUE(bool(f.zone));
	EXPECT_EQ(f.zone->number, 30);
	EXPECT_FALSE(f.zone->south);

	f = frame_from_name( L"UTM7S" );
	EXPECT_EQ(f.zone->number, 7);
	EXPECT_TRUE(f.zone->south);

	EXPECT_EQ(frame_from_name( L"Geographic" ).system, CoordinateSystem::Geographic);
	EXPECT_FALSE(bool(frame_from_name( L"LocalProjected" ).zone));
	EXPECT_EQ(zone_name( UtmZone( 30, false ) ), L"UTM30N");

	EXPECT_EQ(thrown_kind( [](){ frame_from_name( L"EPSG:1234" ); } ), ErrorKind::TransformFailure);
	EXPECT_EQ(thrown_kind( [](){ frame_from_name( L"UTM61N" ); } ), ErrorKind::TransformFailure);
}

TEST_F(CoordinatesTest, NationalGridToGeographic) {
	// Caister water tower, from the national grid documentation. The documented
	// 1.717922, 52.657570 are on OSGB36, shifted to WGS84 they move about 130 m.
	point2 g = service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, 651409.903, 313177.270 );
	EXPECT_NEAR(gx(g), 1.716052, 1e-4);
	EXPECT_NEAR(gy(g), 52.657979, 1e-4);
	EXPECT_GT(std::abs( gx(g) - 1.717922 ), 1e-3);
}

TEST_F(CoordinatesTest, NationalGridRoundTrip) {
	double xs[] = { 500000.0, 651409.903, 300000.0, 123456.78 };
	double ys[] = { 200000.0, 313177.270, 700000.0, 987654.32 };
	for ( int i = 0; i < 4; i++ ) {
		point2 g = service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, xs[i], ys[i] );
		point2 b = service.transform_point( CoordinateSystem::Geographic, CoordinateSystem::NationalGrid, gx(g), gy(g) );
		EXPECT_NEAR(gx(b), xs[i], 0.01);
		EXPECT_NEAR(gy(b), ys[i], 0.01);
	}
}

TEST_F(CoordinatesTest, LocalProjectedRoundTrip) {
	UtmZone zone( 30, false );
	point2 p = service.transform_point( CoordinateSystem::Geographic, zone, -1.5, 52.2 );
	point2 g = service.transform_point( zone, CoordinateSystem::Geographic, gx(p), gy(p) );
	EXPECT_NEAR(gx(g), -1.5, 1e-6);
	EXPECT_NEAR(gy(g), 52.2, 1e-6);
	// Central meridian of zone 30 is at -3 degrees.
	point2 c = service.transform_point( CoordinateSystem::Geographic, zone, -3.0, 0.0 );
	EXPECT_NEAR(gx(c), 500000.0, 1e-3);
	EXPECT_NEAR(gy(c), 0.0, 1e-3);
}

TEST_F(CoordinatesTest, LocalProjectedTargetTakesZoneOfPoint) {
	point2 a = service.transform_point( CoordinateSystem::Geographic, CoordinateSystem::LocalProjected, 10.0, -20.0 );
	point2 b = service.transform_point( CoordinateSystem::Geographic, UtmZone( 32, true ), 10.0, -20.0 );
	EXPECT_NEAR(gx(a), gx(b), 1e-6);
	EXPECT_NEAR(gy(a), gy(b), 1e-6);
}

TEST_F(CoordinatesTest, WebMercator) {
	double lon = -0.1276;
	double lat = 51.5072;
	double pi = geometry::math::pi<double>();
	point2 m = service.transform_point( CoordinateSystem::Geographic, CoordinateSystem::WebMercator, lon, lat );
	EXPECT_NEAR(gx(m), 6378137.0 * lon * pi / 180.0, 0.01);
	EXPECT_NEAR(gy(m), 6378137.0 * std::log( std::tan( pi/4.0 + lat * pi / 360.0 ) ), 0.01);
	point2 g = service.transform_point( CoordinateSystem::WebMercator, CoordinateSystem::Geographic, gx(m), gy(m) );
	EXPECT_NEAR(gx(g), lon, 1e-6);
	EXPECT_NEAR(gy(g), lat, 1e-6);
}

TEST_F(CoordinatesTest, InvalidInputs) {
	CoordinateTransformService& s = service;
	double nan = std::numeric_limits<double>::quiet_NaN();
	double inf = std::numeric_limits<double>::infinity();
	EXPECT_EQ(thrown_kind( [&](){ s.transform_point( CoordinateSystem::Geographic, CoordinateSystem::NationalGrid, 200.0, 0.0 ); } ),
		  ErrorKind::InvalidCoordinate);
	EXPECT_EQ(thrown_kind( [&](){ s.transform_point( CoordinateSystem::Geographic, CoordinateSystem::NationalGrid, 0.0, 91.0 ); } ),
		  ErrorKind::InvalidCoordinate);
	EXPECT_EQ(thrown_kind( [&](){ s.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, nan, 0.0 ); } ),
		  ErrorKind::InvalidCoordinate);
	EXPECT_EQ(thrown_kind( [&](){ s.transform_point( UtmZone( 30, false ), CoordinateSystem::Geographic, 0.0, inf ); } ),
		  ErrorKind::InvalidCoordinate);
	EXPECT_EQ(thrown_kind( [&](){ s.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, -5.0, 100.0 ); } ),
		  ErrorKind::InvalidCoordinate);
	EXPECT_EQ(thrown_kind( [&](){ s.transform_point( CoordinateSystem::LocalProjected, CoordinateSystem::Geographic, 500000.0, 0.0 ); } ),
		  ErrorKind::TransformFailure);
}

TEST_F(CoordinatesTest, SameFrameIsIdentity) {
	point2 p = service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::NationalGrid, 1234.5, 6789.0 );
	EXPECT_DOUBLE_EQ(gx(p), 1234.5);
	EXPECT_DOUBLE_EQ(gy(p), 6789.0);
}

TEST_F(CoordinatesTest, BatchReportsFailuresPerIndex) {
	vector<point2> pts;
	pts.push_back( point2( 500000.0, 200000.0 ) );
	pts.push_back( point2( -10.0, 200000.0 ) );
	pts.push_back( point2( 500200.0, 200200.0 ) );
	vector<TransformResult> res = service.transform_batch( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, pts );
	ASSERT_EQ(res.size(), 3u);
	EXPECT_TRUE(res[0].ok);
	EXPECT_FALSE(res[1].ok);
	EXPECT_EQ(res[1].error, ErrorKind::InvalidCoordinate);
	EXPECT_TRUE(res[2].ok);
	EXPECT_LT(gx(res[0].point), gx(res[2].point));
	EXPECT_LT(gy(res[0].point), gy(res[2].point));
}

TEST_F(CoordinatesTest, BatchSharesOneLocalFrame) {
	// Each side of the border between zones 29 and 30, the centroid is in 30.
	vector<point2> pts;
	pts.push_back( point2( -6.1, 54.0 ) );
	pts.push_back( point2( -5.7, 54.0 ) );
	EXPECT_EQ(service.local_zone( CoordinateSystem::Geographic, pts ), UtmZone( 30, false ));

	vector<TransformResult> res = service.transform_batch( CoordinateSystem::Geographic, CoordinateSystem::LocalProjected, pts );
	ASSERT_EQ(res.size(), 2u);
	for ( size_t i = 0; i < pts.size(); i++ ) {
		ASSERT_TRUE(res[i].ok);
		point2 z30 = service.transform_point( CoordinateSystem::Geographic, UtmZone( 30, false ), gx(pts[i]), gy(pts[i]) );
		EXPECT_NEAR(gx(res[i].point), gx(z30), 1e-6);
		EXPECT_NEAR(gy(res[i].point), gy(z30), 1e-6);
	}
}

TEST_F(CoordinatesTest, BatchWithoutLocatablePoints) {
	vector<point2> pts;
	pts.push_back( point2( 500.0, 95.0 ) );
	vector<TransformResult> res = service.transform_batch( CoordinateSystem::Geographic, CoordinateSystem::LocalProjected, pts );
	ASSERT_EQ(res.size(), 1u);
	EXPECT_FALSE(res[0].ok);
	EXPECT_EQ(res[0].error, ErrorKind::InvalidCoordinate);
}

TEST_F(CoordinatesTest, BatchFromLocalProjectedNeedsZone) {
	vector<point2> pts;
	pts.push_back( point2( 500000.0, 5700000.0 ) );
	pts.push_back( point2( 500100.0, 5700100.0 ) );
	vector<TransformResult> res = service.transform_batch( CoordinateSystem::LocalProjected, CoordinateSystem::Geographic, pts );
	ASSERT_EQ(res.size(), 2u);
	for ( const TransformResult& r: res ) {
		EXPECT_FALSE(r.ok);
		EXPECT_EQ(r.error, ErrorKind::TransformFailure);
	}
	res = service.transform_batch( UtmZone( 30, false ), CoordinateSystem::Geographic, pts );
	EXPECT_TRUE(res[0].ok and res[1].ok);
}

TEST_F(CoordinatesTest, CacheCountsHitsMissesAndErrors) {
	service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, 500000.0, 200000.0 );
	service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, 500000.001, 200000.001 );
	EXPECT_EQ(thrown_kind( [this](){ service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, -1.0, 0.0 ); } ),
		  ErrorKind::InvalidCoordinate);
	CacheStats s = service.cache_stats();
	EXPECT_EQ(s.misses, 1u);
	EXPECT_EQ(s.hits, 1u);
	EXPECT_EQ(s.errors, 1u);
	EXPECT_EQ(s.size, 1u);

	service.clear_cache();
	s = service.cache_stats();
	EXPECT_EQ(s.hits + s.misses + s.errors, 0u);
	EXPECT_EQ(s.size, 0u);
}

TEST_F(CoordinatesTest, CacheCapacityFromParams) {
	map<wstring, wstring> params;
	params[L"cache_capacity"] = L"1";
	service.set_params( params );
	service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, 500000.0, 200000.0 );
	service.transform_point( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, 400000.0, 300000.0 );
	EXPECT_EQ(service.cache_stats().size, 1u);
	EXPECT_EQ(service.cache_stats().capacity, 1u);
	EXPECT_EQ(service.params().cache_capacity, 1u);
}

TEST_F(CoordinatesTest, SharedServiceBetweenThreads) {
	vector<point2> pts;
	for ( int i = 0; i < 40; i++ ) {
		pts.push_back( point2( 400000.0 + 250.0 * i, 200000.0 + 150.0 * i ) );
	}
	CoordinateTransformService reference;
	vector<TransformResult> expected = reference.transform_batch( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, pts );

	map<wstring, wstring> small;
	small[L"cache_capacity"] = L"8";
	map<wstring, wstring> large;
	large[L"cache_capacity"] = L"16";
	service.set_params( large );

	vector<int> wrong(4, 0);
	vector<std::thread> workers;
	for ( int t = 0; t < 4; t++ ) {
		workers.push_back( std::thread( [this, &pts, &expected, &wrong, t]() {
			for ( int round = 0; round < 20; round++ ) {
				vector<TransformResult> res = service.transform_batch( CoordinateSystem::NationalGrid, CoordinateSystem::Geographic, pts );
				for ( size_t i = 0; i < res.size(); i++ ) {
					if ( not res[i].ok or std::abs( gx(res[i].point) - gx(expected[i].point) ) > 1e-9
					     or std::abs( gy(res[i].point) - gy(expected[i].point) ) > 1e-9 ) {
						wrong[t]++;
					}
				}
			}
		} ) );
	}
	std::thread tuner( [this, &small, &large]() {
		for ( int round = 0; round < 50; round++ ) {
			service.set_params( round % 2 ? small : large );
			unsigned long capacity = service.params().cache_capacity;
			EXPECT_TRUE(capacity == 8u or capacity == 16u);
		}
	} );
	for ( std::thread& w: workers ) {
		w.join();
	}
	tuner.join();

	for ( int t = 0; t < 4; t++ ) {
		EXPECT_EQ(wrong[t], 0) << "thread " << t;
	}
	CacheStats s = service.cache_stats();
	EXPECT_LE(s.size, s.capacity);
	EXPECT_EQ(s.errors, 0u);
	EXPECT_EQ(s.hits + s.misses, 4u * 20u * 40u);
}

TEST_F(CoordinatesTest, PopulateFillsMissingFields) {
	vector<SurveyPoint> pts;
	pts.push_back( SurveyPoint( L"A", 500000.0, 200000.0 ) );
	pts.push_back( SurveyPoint( L"B", 500100.0, 200100.0 ) );
	pts.push_back( SurveyPoint( L"C", -50.0, 200100.0 ) );
	pts[1].geo_lat = 50.0;
	pts[1].geo_lon = -0.5;

	optional<UtmZone> zone = service.populate( pts );
	ASSERT_TRUE(bool(zone));
	EXPECT_EQ(*zone, UtmZone( 30, false ));

	EXPECT_TRUE(pts[0].has_geo());
	EXPECT_TRUE(pts[0].has_proj());
	EXPECT_DOUBLE_EQ(*pts[1].geo_lat, 50.0);
	EXPECT_DOUBLE_EQ(*pts[1].geo_lon, -0.5);
	EXPECT_TRUE(pts[1].has_proj());
	EXPECT_FALSE(pts[2].has_geo());
	EXPECT_FALSE(pts[2].has_proj());

	point2 expected = service.transform_point( CoordinateSystem::Geographic, UtmZone( 30, false ), *pts[0].geo_lon, *pts[0].geo_lat );
	EXPECT_NEAR(*pts[0].proj_x, gx(expected), 1e-6);
	EXPECT_NEAR(*pts[0].proj_y, gy(expected), 1e-6);
}

TEST_F(CoordinatesTest, PopulateWithoutLocatablePoints) {
	vector<SurveyPoint> pts;
	pts.push_back( SurveyPoint( L"X", -1.0, -1.0 ) );
	EXPECT_FALSE(bool(service.populate( pts )));
	vector<SurveyPoint> none;
	EXPECT_FALSE(bool(service.populate( none )));
}

}  // namespace
