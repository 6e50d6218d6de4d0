/*

   Copyright (c) 2006-2010, The Scripps Research Institute

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.

   Author: Dr. Oleg Trott <ot14@columbia.edu>,
           The Olson Lab,
           The Scripps Research Institute

*/

#ifndef DOCKRUN_COMMON_H
#define DOCKRUN_COMMON_H

#include <cassert>
#include <string>
#include <limits>
#include <utility> // pair
#include <algorithm> // too common
#include <vector> // used in typedef, and commonly used overall
#include <cmath> // commonly used
#include <iostream> // various debugging everywhere
#include <sstream> // to_string
#include <stdexcept>

#include <boost/filesystem/path.hpp> // typedef'ed

typedef double fl;

template<typename T>
T sqr(T x) {
	return x*x;
}

typedef std::size_t sz;

struct vec {
	fl data[3];
	vec() {
		data[0] = data[1] = data[2] = 0;
	}
	vec(fl x, fl y, fl z) {
		data[0] = x;
		data[1] = y;
		data[2] = z;
	}
	const fl& operator[](sz i) const { assert(i < 3); return data[i]; }
	      fl& operator[](sz i)       { assert(i < 3); return data[i]; }
	fl norm_sqr() const {
		return sqr(data[0]) + sqr(data[1]) + sqr(data[2]);
	}
	fl norm() const {
		return std::sqrt(norm_sqr());
	}
	vec operator+(const vec& v) const {
		return vec(data[0] + v[0],
		           data[1] + v[1],
		           data[2] + v[2]);
	}
	vec operator-(const vec& v) const {
		return vec(data[0] - v[0],
		           data[1] - v[1],
		           data[2] - v[2]);
	}
};

inline std::ostream& operator<<(std::ostream& out, const vec& v) {
	out << "(" << v[0] << ", " << v[1] << ", " << v[2] << ")";
	return out;
}

typedef std::vector<vec> vecv;
typedef boost::filesystem::path path;

struct internal_error {
	std::string file;
	unsigned line;
	internal_error(const std::string& file_, unsigned line_) : file(file_), line(line_) {}
};

#ifdef NDEBUG
	#define DOCKRUN_CHECK(P) do { if(!(P)) throw internal_error(__FILE__, __LINE__); } while(false)
#else
	#define DOCKRUN_CHECK(P) assert(P)
#endif

//bad option values and unusable inputs that the caller has to fix
struct usage_error : public std::runtime_error {
	usage_error(const std::string& message) : std::runtime_error(message) {}
};

inline fl vec_distance_sqr(const vec& a, const vec& b) {
	return sqr(a[0] - b[0]) + \
		   sqr(a[1] - b[1]) + \
		   sqr(a[2] - b[2]);
}

inline bool starts_with(const std::string& str, const std::string& start) {
	return str.size() >= start.size() && str.substr(0, start.size()) == start;
}

#endif
