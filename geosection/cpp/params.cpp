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
#include "params.hpp"
#include <sstream>

Params::Params(): cache_capacity(2048), circle_segments(32), fit_tolerance(1e-9), section_extension(0.2)
{
}

static string narrow( const wstring& w ) {
	return string( w.begin(), w.end() );
}

static double parse_number( const wstring& key, const wstring& value ) {
	std::wistringstream is(value);
	double v;
	is >> v;
	if ( is.fail() or not is.eof() or not std::isfinite(v) ) {
		throw GeosectionException( ErrorKind::InvalidParameter, "parameter " + narrow(key) + " is not a number: " + narrow(value) );
	}
	return v;
}

void Params::update( const map<wstring, wstring>& params ) {
	Params result = *this;
	auto kv = params.find( L"cache_capacity" );
	if ( kv != params.end() ) {
		double v = parse_number( kv->first, kv->second );
		if ( v < 1 or v != std::floor(v) ) {
			throw GeosectionException( ErrorKind::InvalidParameter, "cache_capacity must be a positive integer" );
		}
		result.cache_capacity = size_t(v);
	}
	kv = params.find( L"circle_segments" );
	if ( kv != params.end() ) {
		double v = parse_number( kv->first, kv->second );
		if ( v < 8 or v != std::floor(v) ) {
			throw GeosectionException( ErrorKind::InvalidParameter, "circle_segments must be an integer of at least 8" );
		}
		result.circle_segments = int(v);
	}
	kv = params.find( L"fit_tolerance" );
	if ( kv != params.end() ) {
		double v = parse_number( kv->first, kv->second );
		if ( v <= 0 ) {
			throw GeosectionException( ErrorKind::InvalidParameter, "fit_tolerance must be positive" );
		}
		result.fit_tolerance = v;
	}
	kv = params.find( L"section_extension" );
	if ( kv != params.end() ) {
		double v = parse_number( kv->first, kv->second );
		if ( v < 0 ) {
			throw GeosectionException( ErrorKind::InvalidParameter, "section_extension must not be negative" );
		}
		result.section_extension = v;
	}
	*this = result;
}

map<wstring, wstring> Params::as_map() const {
	map<wstring, wstring> out;
	out[L"cache_capacity"] = std::to_wstring( this->cache_capacity );
	out[L"circle_segments"] = std::to_wstring( this->circle_segments );
	std::wostringstream tol;
	tol << this->fit_tolerance;
	out[L"fit_tolerance"] = tol.str();
	std::wostringstream ext;
	ext << this->section_extension;
	out[L"section_extension"] = ext.str();
	return out;
}
