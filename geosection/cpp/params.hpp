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
#ifndef GEOSECTION_PARAMS_HPP
#define GEOSECTION_PARAMS_HPP
#include "basic.hpp"

// Tunable values of the engine. Read from a string map, the way the python side passes them.
struct Params {
	size_t cache_capacity;
	int circle_segments;
	double fit_tolerance;
	double section_extension;

	Params();

	// Overrides the values whose keys are present: cache_capacity, circle_segments,
	// fit_tolerance and section_extension. Unknown keys are ignored.
	void update( const map<wstring, wstring>& params );
	map<wstring, wstring> as_map() const;
};

#endif
