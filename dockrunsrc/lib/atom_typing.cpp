/*
 * atom_typing.cpp
 *
 *  Residue tables for AutoDock types.  A = aromatic carbon, C = aliphatic
 *  carbon, N = nitrogen that does not accept hydrogen bonds (donor when it
 *  carries a hydrogen), NA = acceptor nitrogen, OA = acceptor oxygen,
 *  SA = acceptor sulfur, HD = polar hydrogen.
 */

#include "atom_typing.h"
#include <cctype>
#include <boost/unordered_map.hpp>
#include <boost/algorithm/string.hpp>

const char* const default_ad_type = "A";

typedef boost::unordered_map<std::string, std::string> name_type_map;
typedef boost::unordered_map<std::string, name_type_map> residue_type_map;

static void add_types(residue_type_map& m, const std::string& res, const char* const pairs[][2], unsigned n) {
  name_type_map& names = m[res];
  for (unsigned i = 0; i < n; i++) {
    names[pairs[i][0]] = pairs[i][1];
  }
}

#define ADD_RESIDUE(m, res, table) add_types(m, res, table, sizeof(table)/sizeof(table[0]))

static residue_type_map make_residue_types() {
  static const char* const ALA[][2] = { { "CB", "C" } };
  static const char* const VAL[][2] = { { "CB", "C" }, { "CG1", "C" }, { "CG2", "C" } };
  static const char* const LEU[][2] = { { "CB", "C" }, { "CG", "C" }, { "CD1", "C" }, { "CD2", "C" } };
  static const char* const ILE[][2] = { { "CB", "C" }, { "CG1", "C" }, { "CG2", "C" }, { "CD1", "C" } };
  //thioether sulfur
  static const char* const MET[][2] = { { "CB", "C" }, { "CG", "C" }, { "SD", "SA" }, { "CE", "C" } };
  //ring nitrogen has no hydrogen
  static const char* const PRO[][2] = { { "N", "N" }, { "CA", "C" }, { "CB", "C" }, { "CG", "C" },
      { "CD", "C" }, { "C", "C" }, { "O", "OA" } };
  static const char* const PHE[][2] = { { "CB", "C" }, { "CG", "A" }, { "CD1", "A" }, { "CD2", "A" },
      { "CE1", "A" }, { "CE2", "A" }, { "CZ", "A" } };
  static const char* const TYR[][2] = { { "CB", "C" }, { "CG", "A" }, { "CD1", "A" }, { "CD2", "A" },
      { "CE1", "A" }, { "CE2", "A" }, { "CZ", "A" }, { "OH", "OA" } };
  //indole NH donates
  static const char* const TRP[][2] = { { "CB", "C" }, { "CG", "A" }, { "CD1", "A" }, { "CD2", "A" },
      { "NE1", "N" }, { "CE2", "A" }, { "CE3", "A" }, { "CZ2", "A" }, { "CZ3", "A" }, { "CH2", "A" } };
  //tautomer unknown, both ring nitrogens may accept
  static const char* const HIS[][2] = { { "CB", "C" }, { "CG", "A" }, { "ND1", "NA" }, { "CD2", "A" },
      { "CE1", "A" }, { "NE2", "NA" } };
  static const char* const HID[][2] = { { "CB", "C" }, { "CG", "A" }, { "ND1", "N" }, { "CD2", "A" },
      { "CE1", "A" }, { "NE2", "NA" } };
  static const char* const HIE[][2] = { { "CB", "C" }, { "CG", "A" }, { "ND1", "NA" }, { "CD2", "A" },
      { "CE1", "A" }, { "NE2", "N" } };
  static const char* const HIP[][2] = { { "CB", "C" }, { "CG", "A" }, { "ND1", "N" }, { "CD2", "A" },
      { "CE1", "A" }, { "NE2", "N" } };
  static const char* const SER[][2] = { { "CB", "C" }, { "OG", "OA" } };
  static const char* const THR[][2] = { { "CB", "C" }, { "OG1", "OA" }, { "CG2", "C" } };
  static const char* const CYS[][2] = { { "CB", "C" }, { "SG", "SA" } };
  //disulfide bonded cysteine
  static const char* const CYX[][2] = { { "CB", "C" }, { "SG", "SA" } };
  //side chain amide nitrogens donate
  static const char* const ASN[][2] = { { "CB", "C" }, { "CG", "C" }, { "OD1", "OA" }, { "ND2", "N" } };
  static const char* const GLN[][2] = { { "CB", "C" }, { "CG", "C" }, { "CD", "C" }, { "OE1", "OA" },
      { "NE2", "N" } };
  static const char* const ASP[][2] = { { "CB", "C" }, { "CG", "C" }, { "OD1", "OA" }, { "OD2", "OA" } };
  static const char* const GLU[][2] = { { "CB", "C" }, { "CG", "C" }, { "CD", "C" }, { "OE1", "OA" },
      { "OE2", "OA" } };
  static const char* const LYS[][2] = { { "CB", "C" }, { "CG", "C" }, { "CD", "C" }, { "CE", "C" },
      { "NZ", "N" } };
  static const char* const ARG[][2] = { { "CB", "C" }, { "CG", "C" }, { "CD", "C" }, { "NE", "N" },
      { "CZ", "C" }, { "NH1", "N" }, { "NH2", "N" } };

  //ions whose residue name is the element, e.g. HETATM ZN ZN
  static const char* const ZN[][2] = { { "ZN", "Zn" } };
  static const char* const FE[][2] = { { "FE", "Fe" } };
  static const char* const MG[][2] = { { "MG", "Mg" } };
  static const char* const MN[][2] = { { "MN", "Mn" } };
  static const char* const CA[][2] = { { "CA", "Ca" } };

  residue_type_map types;
  ADD_RESIDUE(types, "ALA", ALA);
  ADD_RESIDUE(types, "VAL", VAL);
  ADD_RESIDUE(types, "LEU", LEU);
  ADD_RESIDUE(types, "ILE", ILE);
  ADD_RESIDUE(types, "MET", MET);
  ADD_RESIDUE(types, "PRO", PRO);
  ADD_RESIDUE(types, "PHE", PHE);
  ADD_RESIDUE(types, "TYR", TYR);
  ADD_RESIDUE(types, "TRP", TRP);
  ADD_RESIDUE(types, "HIS", HIS);
  ADD_RESIDUE(types, "HID", HID);
  ADD_RESIDUE(types, "HIE", HIE);
  ADD_RESIDUE(types, "HIP", HIP);
  ADD_RESIDUE(types, "SER", SER);
  ADD_RESIDUE(types, "THR", THR);
  ADD_RESIDUE(types, "CYS", CYS);
  ADD_RESIDUE(types, "CYX", CYX);
  ADD_RESIDUE(types, "ASN", ASN);
  ADD_RESIDUE(types, "GLN", GLN);
  ADD_RESIDUE(types, "ASP", ASP);
  ADD_RESIDUE(types, "ASH", ASP);
  ADD_RESIDUE(types, "GLU", GLU);
  ADD_RESIDUE(types, "GLH", GLU);
  ADD_RESIDUE(types, "LYS", LYS);
  ADD_RESIDUE(types, "LYN", LYS);
  ADD_RESIDUE(types, "ARG", ARG);
  ADD_RESIDUE(types, "ZN", ZN);
  ADD_RESIDUE(types, "FE", FE);
  ADD_RESIDUE(types, "MG", MG);
  ADD_RESIDUE(types, "MN", MN);
  ADD_RESIDUE(types, "CA", CA);
  return types;
}

static const residue_type_map& residue_types() {
  static const residue_type_map types = make_residue_types();
  return types;
}

static name_type_map make_backbone_types() {
  static const char* const BACKBONE[][2] = { { "N", "N" }, { "CA", "C" }, { "C", "C" }, { "O", "OA" },
      { "OXT", "OA" } };
  name_type_map types;
  for (unsigned i = 0, n = sizeof(BACKBONE) / sizeof(BACKBONE[0]); i < n; i++) {
    types[BACKBONE[i][0]] = BACKBONE[i][1];
  }
  return types;
}

static const name_type_map& backbone_types() {
  static const name_type_map types = make_backbone_types();
  return types;
}

static bool starts_with_halogen(const std::string& name, const char* symbol) {
  return name.size() >= 2 && name.compare(0, 2, symbol) == 0;
}

std::string infer_type_from_name(const std::string& atom_name) {
  std::string name = boost::to_upper_copy(boost::trim_copy(atom_name));

  //PDB v2 hydrogen names such as 1HB
  size_t start = 0;
  while (start < name.size() && std::isdigit(static_cast<unsigned char>(name[start])))
    start++;
  name = name.substr(start);
  if (name.empty()) return default_ad_type;

  //two letter halogens before the single letter switch
  if (starts_with_halogen(name, "CL")) return "Cl";
  if (starts_with_halogen(name, "BR")) return "Br";

  switch (name[0]) {
  case 'C':
    return "C";
  case 'N':
    return "N";
  case 'O':
    return "OA";
  case 'S':
    return "SA";
  case 'H':
    return "HD";
  case 'F':
    return "F";
  case 'P':
    return "P";
  case 'I':
    return "I";
  default:
    return default_ad_type;
  }
}

std::string assign_atom_type(const std::string& res_name, const std::string& atom_name) {
  std::string res = boost::to_upper_copy(boost::trim_copy(res_name));
  std::string name = boost::to_upper_copy(boost::trim_copy(atom_name));

  const residue_type_map& residues = residue_types();
  residue_type_map::const_iterator r = residues.find(res);
  if (r != residues.end()) {
    name_type_map::const_iterator t = r->second.find(name);
    if (t != r->second.end()) return t->second;
  }

  const name_type_map& backbone = backbone_types();
  name_type_map::const_iterator b = backbone.find(name);
  if (b != backbone.end()) return b->second;

  return infer_type_from_name(atom_name);
}
