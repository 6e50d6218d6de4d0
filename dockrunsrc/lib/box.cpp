#include "box.h"

#include <cctype>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

Box bounding_box(const vecv& coords) {
  Box b;
  for (sz i = 0; i < coords.size(); i++) {
    b.add_coord(coords[i]);
  }
  if (b.empty()) {
    b.min_x = b.max_x = b.min_y = b.max_y = b.min_z = b.max_z = 0;
  }
  return b;
}

Box bounding_box(const pdbqt_atoms& atoms) {
  vecv coords;
  coords.reserve(atoms.size());
  for (sz i = 0; i < atoms.size(); i++) {
    coords.push_back(atoms[i].coords);
  }
  return bounding_box(coords);
}

//center of the bounding box (as opposed to center of mass), padded on each side
static grid_box padded_box(Box b, fl padding, fl min_size) {
  b.expand(padding);
  vec span = b.span();
  vec size;
  for (unsigned i = 0; i < 3; i++) {
    size[i] = std::max(span[i], min_size);
  }
  return grid_box(b.center(), size);
}

grid_box centered_box(const pdbqt_atoms& atoms, fl padding) {
  return padded_box(bounding_box(atoms), padding, min_padded_box_size);
}

grid_box blind_box(const pdbqt_atoms& receptor, fl padding) {
  if (receptor.empty()) {
    return grid_box(vec(0, 0, 0),
        vec(default_blind_box_size, default_blind_box_size, default_blind_box_size));
  }
  return centered_box(receptor, padding);
}

grid_box ligand_box(const pdbqt_atoms& ligand, fl padding) {
  if (ligand.empty()) {
    return grid_box(vec(0, 0, 0),
        vec(default_ligand_box_size, default_ligand_box_size, default_ligand_box_size));
  }
  return centered_box(ligand, padding);
}

namespace {
//one selector token, res_name empty for a bare residue number
struct residue_key {
    std::string res_name;
    int res_seq;
};
}

//split "ASP25" into ASP and 25; false if the token isn't letters followed by a number
static bool parse_residue_token(const std::string& token, residue_key& key) {
  sz i = 0;
  while (i < token.size() && std::isalpha(static_cast<unsigned char>(token[i])))
    i++;
  std::string digits = token.substr(i);
  if (digits.empty()) return false;
  try {
    key.res_seq = boost::lexical_cast<int>(digits);
  } catch (boost::bad_lexical_cast&) {
    return false;
  }
  key.res_name = boost::to_upper_copy(token.substr(0, i));
  return true;
}

residue_box_result residue_centered_box(const pdbqt_atoms& atoms, const std::string& selector,
    fl padding) {
  residue_box_result ret;

  std::vector<std::string> tokens;
  std::string trimmed = boost::trim_copy(selector);
  if (!trimmed.empty()) {
    boost::split(tokens, trimmed, boost::is_any_of(", \t\r\n"), boost::token_compress_on);
  }

  std::vector<residue_key> keys;
  for (sz i = 0; i < tokens.size(); i++) {
    residue_key key;
    if (!tokens[i].empty() && parse_residue_token(tokens[i], key)) keys.push_back(key);
  }
  if (keys.empty()) {
    ret.error = trimmed.empty() ? "empty selector" : "no residues matched " + trimmed;
    return ret;
  }

  pdbqt_atoms matched;
  for (sz i = 0; i < atoms.size(); i++) {
    const pdbqt_atom& a = atoms[i];
    std::string res = boost::to_upper_copy(a.res_name);
    for (sz k = 0; k < keys.size(); k++) {
      if (a.res_seq == keys[k].res_seq && (keys[k].res_name.empty() || keys[k].res_name == res)) {
        matched.push_back(a);
        break;
      }
    }
  }

  ret.match_count = matched.size();
  if (matched.empty()) {
    ret.error = "no residues matched " + trimmed;
    return ret;
  }
  ret.box = centered_box(matched, padding);
  return ret;
}
