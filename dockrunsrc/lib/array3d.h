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

#ifndef DOCKRUN_ARRAY3D_H
#define DOCKRUN_ARRAY3D_H

#include <exception> // std::bad_alloc
#include <new>
#include "common.h"

inline sz checked_multiply(sz i, sz j) {
	if(i == 0 || j == 0) return 0;
	const sz tmp = i * j;
	if(tmp / i != j)
		throw std::bad_alloc(); // can't alloc if the size makes sz wrap around
	return tmp;
}

inline sz checked_multiply(sz i, sz j, sz k) {
	return checked_multiply(checked_multiply(i, j), k);
}

//dense grid indexed by integer cell coordinates; T must not be bool
template<typename T>
class array3d {
	sz m_i, m_j, m_k;
	std::vector<T> m_data;
public:
	array3d() : m_i(0), m_j(0), m_k(0) {}
	array3d(sz i, sz j, sz k, const T& init = T()) : m_i(i), m_j(j), m_k(k), m_data(checked_multiply(i, j, k), init) {}
	//signed so neighborhood offsets can be checked before indexing
	bool in_range(long i, long j, long k) const {
		return i >= 0 && j >= 0 && k >= 0 && sz(i) < m_i && sz(j) < m_j && sz(k) < m_k;
	}
	T&       operator()(sz i, sz j, sz k)       { return m_data[i + m_i*(j + m_j*k)]; }
	const T& operator()(sz i, sz j, sz k) const { return m_data[i + m_i*(j + m_j*k)]; }
};

#endif
