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

#ifndef DOCKRUN_CONVERT_SUBSTRING_H
#define DOCKRUN_CONVERT_SUBSTRING_H

#include <cctype> // for isspace
#include <boost/lexical_cast.hpp>
#include "common.h"

struct bad_conversion {};

//trimmed text of the 1-based, inclusive column range [i, j]; columns past the
//end of the line are treated as blank
inline std::string column_text(const std::string& str, sz i, sz j) {
	if(i < 1 || i > j+1 || i > str.size()) return std::string();
	if(j > str.size()) j = str.size();

	// omit leading whitespace
	while(i <= j && std::isspace(static_cast<unsigned char>(str[i-1])))
		++i;
	// omit trailing whitespace
	while(i <= j && std::isspace(static_cast<unsigned char>(str[j-1])))
		--j;

	return str.substr(i-1, j-i+1);
}

template<typename T>
T convert_substring(const std::string& str, sz i, sz j) { // indexes are 1-based, the substring should be non-null
	if(i < 1 || i > j+1 || j > str.size()) throw bad_conversion();

	const std::string trimmed = column_text(str, i, j);
	if(trimmed.empty()) throw bad_conversion();

	T tmp;
	try {
		tmp = boost::lexical_cast<T>(trimmed);
	}
	catch(boost::bad_lexical_cast&) {
		throw bad_conversion();
	}
	return tmp;
}

inline bool substring_is_blank(const std::string& str, sz i, sz j) { // indexes are 1-based, a range past the end is blank
	return column_text(str, i, j).empty();
}

#endif
