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

#include <sstream>
#include <cctype> // isspace
#include <cmath> // isfinite
#include <boost/unordered_set.hpp>
#include <boost/assign/list_of.hpp>
#include "pdbqt.h"
#include "atom_typing.h"
#include "convert_substring.h"

struct atom_syntax_error {
	std::string nature;
	atom_syntax_error(const std::string& nature_) : nature(nature_) {}
};

template<typename T>
T checked_convert_substring(const std::string& str, sz i, sz j, const std::string& dest_nature) {
	try {
		return convert_substring<T>(str, i, j);
	}
	catch(bad_conversion&) {
		throw atom_syntax_error(std::string("\"") + column_text(str, i, j) + "\" is not a valid " + dest_nature);
	}
}

//optional columns take the default when blank or missing
template<typename T>
T optional_convert_substring(const std::string& str, sz i, sz j, T dflt, const std::string& dest_nature) {
	if(substring_is_blank(str, i, j))
		return dflt;
	if(j > str.size()) j = str.size();
	return checked_convert_substring<T>(str, i, j, dest_nature);
}

static char column_char(const std::string& str, sz i) { // 1-based
	if(i < 1 || i > str.size()) return ' ';
	return str[i-1];
}

//raw text of columns [i, i+len), space padded; no trimming so digits are kept verbatim
static std::string raw_columns(const std::string& str, sz i, sz len) {
	std::string ret(len, ' ');
	for(sz k = 0; k < len; k++) {
		sz pos = i + k;
		if(pos < str.size())
			ret[k] = str[pos];
	}
	return ret;
}

static std::string chomp(const std::string& line) {
	if(!line.empty() && line[line.size()-1] == '\r')
		return line.substr(0, line.size()-1);
	return line;
}

bool is_atom_record(const std::string& line) {
	return starts_with(line, "ATOM") || starts_with(line, "HETATM");
}

static pdbqt_atom parse_pdbqt_atom_string(const std::string& str) {
	if(str.size() < 54) throw atom_syntax_error("The line is too short");

	pdbqt_atom a;
	a.record = column_text(str, 1, 6);
	a.serial = optional_convert_substring<int>(str, 7, 11, 0, "atom number");
	a.name = column_text(str, 13, 16);
	a.alt_loc = column_char(str, 17);
	a.res_name = column_text(str, 18, 20);
	a.chain_id = column_char(str, 22);
	a.res_seq = optional_convert_substring<int>(str, 23, 26, 0, "residue number");
	a.i_code = column_char(str, 27);
	a.coords = vec(checked_convert_substring<fl>(str, 31, 38, "coordinate"),
	               checked_convert_substring<fl>(str, 39, 46, "coordinate"),
	               checked_convert_substring<fl>(str, 47, 54, "coordinate"));
	for(unsigned i = 0; i < 3; i++)
		if(!std::isfinite(a.coords[i]))
			throw atom_syntax_error("\"" + column_text(str, 31 + 8*i, 38 + 8*i) + "\" is not a finite coordinate");
	a.occupancy = optional_convert_substring<fl>(str, 55, 60, 1.0, "occupancy");
	a.temp_factor = optional_convert_substring<fl>(str, 61, 66, 0.0, "temperature factor");
	a.partial_charge = optional_convert_substring<fl>(str, 71, 76, 0.0, "charge");
	a.ad_type = column_text(str, 78, 79);
	return a;
}

bool parse_atom_record(const std::string& line, pdbqt_atom& atom) {
	const std::string str = chomp(line);
	if(!is_atom_record(str)) return false;
	try {
		atom = parse_pdbqt_atom_string(str);
	}
	catch(atom_syntax_error&) {
		return false;
	}
	return true;
}

pdbqt_atoms parse_atoms(const std::string& text) {
	pdbqt_atoms atoms;
	std::istringstream in(text);
	std::string line;
	while(std::getline(in, line)) {
		pdbqt_atom a;
		if(parse_atom_record(line, a))
			atoms.push_back(a);
	}
	return atoms;
}

//fixed width docking record; coordinates are copied character for character
static std::string pdbqt_line(const std::string& str, const std::string& adtype) {
	std::string out;
	out.reserve(80);
	out += raw_columns(str, 0, 6); //record name
	out += raw_columns(str, 6, 5); //serial
	out += ' ';
	out += raw_columns(str, 12, 4); //atom name
	out += raw_columns(str, 16, 1); //alt loc
	out += raw_columns(str, 17, 3); //residue name
	out += ' ';
	out += raw_columns(str, 21, 1); //chain
	out += raw_columns(str, 22, 4); //residue number
	out += raw_columns(str, 26, 1); //insertion code
	out += "   ";
	out += raw_columns(str, 30, 8);
	out += raw_columns(str, 38, 8);
	out += raw_columns(str, 46, 8);
	out += "  1.00"; //occupancy
	out += "  0.00"; //temperature factor
	out += "    ";
	out += " 0.000"; //partial charge placeholder
	out += ' ';
	std::string type = adtype;
	type.resize(2, ' ');
	out += type;
	return out;
}

std::string convert_to_pdbqt(const std::string& text) {
	std::ostringstream out;
	std::istringstream in(text);
	std::string line;
	while(std::getline(in, line)) {
		line = chomp(line);
		if(is_atom_record(line)) {
			pdbqt_atom a;
			//an atom line without three finite coordinates is dropped, not copied;
			//the engine would reject the whole receptor over it
			if(!parse_atom_record(line, a)) continue;
			out << pdbqt_line(line, assign_atom_type(a.res_name, a.name)) << '\n';
		}
		else if(starts_with(line, "TER") || starts_with(line, "END")) {
			out << line << '\n';
		}
	}
	return out.str();
}

bool is_valid_pdbqt(const std::string& text) {
	bool has_atoms = false;
	std::istringstream in(text);
	std::string line;
	while(std::getline(in, line)) {
		line = chomp(line);
		//the engine rejects these PDB header records
		if(starts_with(line, "HEADER") || starts_with(line, "COMPND")
				|| starts_with(line, "SOURCE") || starts_with(line, "SEQRES"))
			return false;

		if(is_atom_record(line)) {
			has_atoms = true;
			if(line.size() < 77) return false;
			//plain PDB has a segment id or nothing where PDBQT has the charge
			if(substring_is_blank(line, 71, 76)) return false;
			try {
				convert_substring<fl>(line, 71, 76);
			}
			catch(bad_conversion&) {
				return false;
			}
		}
	}
	return has_atoms;
}

static const boost::unordered_set<std::string>& polymer_residues() {
	static const boost::unordered_set<std::string> residues = boost::assign::list_of
		("ALA")("ARG")("ASN")("ASP")("CYS")("GLN")("GLU")("GLY")("HIS")("ILE")
		("LEU")("LYS")("MET")("PHE")("PRO")("SER")("THR")("TRP")("TYR")("VAL")
		//protonation variants
		("HID")("HIE")("HIP")("CYX")("ASH")("GLH")("LYN");
	return residues;
}

std::string remove_non_polymer_atoms(const std::string& text) {
	const boost::unordered_set<std::string>& keep = polymer_residues();
	std::ostringstream out;
	std::istringstream in(text);
	std::string line;
	while(std::getline(in, line)) {
		line = chomp(line);
		if(is_atom_record(line)) {
			if(keep.count(column_text(line, 18, 20)))
				out << line << '\n';
		}
		else {
			out << line << '\n';
		}
	}
	return out.str();
}

std::string prepare_receptor(const std::string& text) {
	std::string stripped = remove_non_polymer_atoms(text);
	if(is_valid_pdbqt(stripped))
		return stripped;
	return convert_to_pdbqt(stripped);
}
