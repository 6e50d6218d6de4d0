#include <cmath> // for ceil
#include <string>
#include "common.h"
#include "pdbqt.h"

#ifndef DOCKRUN_BOX_H
#define DOCKRUN_BOX_H

/* store a bounding box */
struct Box {
    fl min_x, max_x;
    fl min_y, max_y;
    fl min_z, max_z;

    Box()
        : min_x(HUGE_VAL), max_x(-HUGE_VAL), min_y(HUGE_VAL), max_y(-HUGE_VAL),
            min_z(HUGE_VAL), max_z(-HUGE_VAL) {
    }

    //update min and max to include x,y,z
    void add_coord(fl x, fl y, fl z) {
      min_x = std::min(min_x, x);
      min_y = std::min(min_y, y);
      min_z = std::min(min_z, z);
      max_x = std::max(max_x, x);
      max_y = std::max(max_y, y);
      max_z = std::max(max_z, z);
    }
    void add_coord(const vec& v) {
      add_coord(v[0], v[1], v[2]);
    }

    //grow box in all dimensions by d
    void expand(fl d) {
      min_x -= d;
      max_x += d;
      min_y -= d;
      max_y += d;
      min_z -= d;
      max_z += d;
    }

    bool empty() const {
      return min_x > max_x;
    }

    vec center() const {
      return vec((max_x + min_x) / 2.0, (max_y + min_y) / 2.0, (max_z + min_z) / 2.0);
    }

    vec span() const {
      return vec(max_x - min_x, max_y - min_y, max_z - min_z);
    }
};

//the search space handed to the engine
struct grid_box {
    vec center;
    vec size;

    grid_box()
        : center(0, 0, 0), size(0, 0, 0) {
    }
    grid_box(const vec& c, const vec& s)
        : center(c), size(s) {
    }

    vec min_corner() const {
      return vec(center[0] - size[0] / 2, center[1] - size[1] / 2, center[2] - size[2] / 2);
    }
    vec max_corner() const {
      return vec(center[0] + size[0] / 2, center[1] + size[1] / 2, center[2] + size[2] / 2);
    }
    bool contains(const vec& v) const {
      vec lo = min_corner(), hi = max_corner();
      return v[0] >= lo[0] && v[0] <= hi[0] && v[1] >= lo[1] && v[1] <= hi[1]
          && v[2] >= lo[2] && v[2] <= hi[2];
    }
    //every dimension positive and finite
    bool valid() const {
      for (unsigned i = 0; i < 3; i++) {
        if (!std::isfinite(center[i]) || !std::isfinite(size[i]) || size[i] <= 0) return false;
      }
      return true;
    }
};

const fl min_padded_box_size = 10.0;
const fl default_blind_box_size = 60.0;
const fl default_blind_padding = 10.0;
const fl default_ligand_box_size = 20.0;
const fl default_ligand_padding = 5.0;

//min/max of the atom coordinates, all zero for no atoms
Box bounding_box(const pdbqt_atoms& atoms);
Box bounding_box(const vecv& coords);

//bounding box padded on every side, no dimension smaller than min_padded_box_size
grid_box centered_box(const pdbqt_atoms& atoms, fl padding);

//covers the whole receptor; a default box at the origin if there are no atoms
grid_box blind_box(const pdbqt_atoms& receptor, fl padding = default_blind_padding);

//autobox around a reference ligand
grid_box ligand_box(const pdbqt_atoms& ligand, fl padding = default_ligand_padding);

struct residue_box_result {
    grid_box box;
    sz match_count;
    std::string error; //set when nothing matched

    residue_box_result()
        : match_count(0) {
    }
};

//box around the atoms of the residues named in selector, e.g. "ASP25, HIS57"
//a bare number matches that residue number in any residue
residue_box_result residue_centered_box(const pdbqt_atoms& atoms, const std::string& selector,
    fl padding);

#endif /* DOCKRUN_BOX_H */
