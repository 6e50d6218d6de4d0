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

#ifndef DOCKRUN_PDBQT_H
#define DOCKRUN_PDBQT_H

#include <string>
#include <vector>
#include "common.h"

//one ATOM/HETATM record of a PDB or PDBQT file
struct pdbqt_atom {
	std::string record; //ATOM or HETATM
	int serial;
	std::string name;
	char alt_loc;
	std::string res_name;
	char chain_id;
	int res_seq;
	char i_code;
	vec coords;
	fl occupancy;
	fl temp_factor;
	fl partial_charge;
	std::string ad_type; //AutoDock atom type, empty for plain PDB

	pdbqt_atom() : serial(0), alt_loc(' '), chain_id(' '), res_seq(0), i_code(' '),
			coords(0, 0, 0), occupancy(1.0), temp_factor(0.0), partial_charge(0.0) {}
};

typedef std::vector<pdbqt_atom> pdbqt_atoms;

bool is_atom_record(const std::string& line);

//fills atom from a fixed-column record; returns false if the line is not an
//atom record or is too malformed to use
bool parse_atom_record(const std::string& line, pdbqt_atom& atom);

//every parseable atom record of text, malformed lines are skipped
pdbqt_atoms parse_atoms(const std::string& text);

//rewrite PDB atom records as PDBQT with placeholder charges and inferred types
std::string convert_to_pdbqt(const std::string& text);

//true if text can be handed to the engine without conversion
bool is_valid_pdbqt(const std::string& text);

//drop atom records that are not standard (or protonation variant) amino acids
std::string remove_non_polymer_atoms(const std::string& text);

//strip non-polymer atoms and convert to PDBQT if needed
std::string prepare_receptor(const std::string& text);

#endif
