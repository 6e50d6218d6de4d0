/*
 * pocket.h
 *
 *  Geometric binding site guess for blind docking.  The receptor is dilated
 *  onto a coarse grid and empty cells that are well enclosed by protein are
 *  treated as cavity; the densest cluster of cavity cells becomes the box.
 *  This is a cheap approximation, not a validated pocket finder.
 */

#ifndef DOCKRUN_POCKET_H
#define DOCKRUN_POCKET_H

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "box.h"

struct pocket_site {
    grid_box box;
    fl confidence; //0 to 1
    std::string label; //deep-cavity, surface-pocket, shallow-cleft or center-fallback
    sz cavity_points; //candidates that make up the pocket

    pocket_site()
        : confidence(0), cavity_points(0) {
    }
};

const fl pocket_grid_spacing = 3.0;
const sz pocket_min_atoms = 10;
const unsigned pocket_min_enclosure = 30;
const fl pocket_fallback_size = 25.0;
const fl pocket_fallback_confidence = 0.3;
const fl pocket_padding = 8.0;
const fl pocket_min_size = 20.0;
//occupancy grids larger than this (about 470 A on a side) get the center fallback
const sz pocket_max_cells = 4000000;

//none if there are too few atoms to say anything; otherwise always a usable box,
//the center fallback when nothing is enclosed or the receptor is too spread out to grid
boost::optional<pocket_site> detect_pocket(const pdbqt_atoms& receptor);

//a binding site the structure file itself records
struct known_site {
    std::string label; //"Site AC1" or "Ligand ATP"
    std::string description;
    grid_box box;
};
typedef std::vector<known_site> known_sites;

const sz known_site_min_ligand_atoms = 5;
const fl known_site_padding = 10.0; //added to each dimension, not each side
const fl known_site_merge_distance = 2.0;

//sites from SITE records followed by co-crystallized HETATM ligands (solvent
//and common ions ignored), in file order; a site whose center is within
//known_site_merge_distance of an earlier one is dropped
known_sites find_known_sites(const std::string& pdb_text);

#endif /* DOCKRUN_POCKET_H */
