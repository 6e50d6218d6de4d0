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

#ifndef DOCKRUN_TEE_H
#define DOCKRUN_TEE_H

#include <iostream>
#include "file.h"

//console output mirrored to an optional log file
struct tee {
	ofile* of;
	bool quiet; //suppress the console copy
	tee(bool quiet_ = false) : of(NULL), quiet(quiet_) {}
	void init(const path& name) {
		delete of;
		of = new ofile(name);
	}
	virtual ~tee() { delete of; }
	void flush() {
		if(!quiet)
			std::cout << std::flush;
		if(of)
			(*of) << std::flush;
	}
private:
	tee(const tee&);
	tee& operator=(const tee&);
};

template<typename T>
tee& operator<<(tee& out, const T& x) {
	if(!out.quiet)
		std::cout << x;
	if(out.of)
		(*out.of) << x;
	return out;
}

#endif
