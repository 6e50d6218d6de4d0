/*
 * pocket.cpp
 *
 *  Cells are indexed from the receptor's minimum corner.  Atoms mark their
 *  cell and its 26 neighbors, so marks can land one cell outside the
 *  nominal grid; the occupancy array carries a one cell border to hold them.
 */

#include "pocket.h"
#include "array3d.h"
#include "convert_substring.h"

#include <sstream>
#include <boost/assign/list_of.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/unordered_set.hpp>

namespace {
struct cavity_point {
    vec coords;
    unsigned enclosure;
};
}

static long cell_index(fl coord, fl origin) {
  return static_cast<long>(std::floor((coord - origin) / pocket_grid_spacing));
}

static std::string pocket_label(fl confidence) {
  if (confidence > 0.7) return "deep-cavity";
  if (confidence > 0.4) return "surface-pocket";
  return "shallow-cleft";
}

static pocket_site center_fallback(const Box& b) {
  pocket_site site;
  site.box = grid_box(b.center(),
      vec(pocket_fallback_size, pocket_fallback_size, pocket_fallback_size));
  site.confidence = pocket_fallback_confidence;
  site.label = "center-fallback";
  return site;
}

boost::optional<pocket_site> detect_pocket(const pdbqt_atoms& receptor) {
  if (receptor.size() < pocket_min_atoms) return boost::none;

  Box b = bounding_box(receptor);
  vec origin(b.min_x, b.min_y, b.min_z);
  vec span = b.span();

  //bound the grid before converting extents to cell counts
  for (unsigned i = 0; i < 3; i++) {
    if (!(span[i] / pocket_grid_spacing < fl(pocket_max_cells))) return center_fallback(b);
  }
  long dims[3];
  for (unsigned i = 0; i < 3; i++) {
    dims[i] = static_cast<long>(std::ceil(span[i] / pocket_grid_spacing)) + 2;
  }
  try {
    if (checked_multiply(dims[0] + 2, dims[1] + 2, dims[2] + 2) > pocket_max_cells)
      return center_fallback(b);
  } catch (std::bad_alloc&) {
    return center_fallback(b);
  }

  //cell (x,y,z) is stored at (x+1,y+1,z+1)
  array3d<char> occupied(dims[0] + 2, dims[1] + 2, dims[2] + 2, 0);
  for (sz a = 0; a < receptor.size(); a++) {
    const vec& c = receptor[a].coords;
    long gx = cell_index(c[0], origin[0]);
    long gy = cell_index(c[1], origin[1]);
    long gz = cell_index(c[2], origin[2]);
    for (long dx = -1; dx <= 1; dx++)
      for (long dy = -1; dy <= 1; dy++)
        for (long dz = -1; dz <= 1; dz++) {
          long x = gx + dx + 1, y = gy + dy + 1, z = gz + dz + 1;
          if (occupied.in_range(x, y, z)) occupied(x, y, z) = 1;
        }
  }

  std::vector<cavity_point> candidates;
  for (long gx = 1; gx < dims[0] - 1; gx++)
    for (long gy = 1; gy < dims[1] - 1; gy++)
      for (long gz = 1; gz < dims[2] - 1; gz++) {
        if (occupied(gx + 1, gy + 1, gz + 1)) continue;
        unsigned enclosure = 0;
        for (long dx = -2; dx <= 2; dx++)
          for (long dy = -2; dy <= 2; dy++)
            for (long dz = -2; dz <= 2; dz++) {
              if (dx == 0 && dy == 0 && dz == 0) continue;
              long x = gx + dx + 1, y = gy + dy + 1, z = gz + dz + 1;
              if (occupied.in_range(x, y, z) && occupied(x, y, z)) enclosure++;
            }
        if (enclosure >= pocket_min_enclosure) {
          cavity_point p;
          p.coords = vec(origin[0] + gx * pocket_grid_spacing,
              origin[1] + gy * pocket_grid_spacing,
              origin[2] + gz * pocket_grid_spacing);
          p.enclosure = enclosure;
          candidates.push_back(p);
        }
      }

  if (candidates.empty()) return center_fallback(b);

  //seed on the densest neighborhood of enclosed points
  sz best = 0;
  fl max_score = 0;
  for (sz i = 0; i < candidates.size(); i++) {
    fl score = candidates[i].enclosure;
    for (sz j = 0; j < candidates.size(); j++) {
      fl dist = std::sqrt(vec_distance_sqr(candidates[i].coords, candidates[j].coords));
      if (dist < 10) score += candidates[j].enclosure / (dist + 1);
    }
    if (score > max_score) {
      max_score = score;
      best = i;
    }
  }

  DOCKRUN_CHECK(max_score > 0);

  vecv nearby;
  for (sz j = 0; j < candidates.size(); j++) {
    if (std::sqrt(vec_distance_sqr(candidates[best].coords, candidates[j].coords)) < 15)
      nearby.push_back(candidates[j].coords);
  }

  pocket_site site;
  Box pb = bounding_box(nearby);
  vec pspan = pb.span();
  vec size;
  for (unsigned i = 0; i < 3; i++) {
    size[i] = std::max(pspan[i] + pocket_padding, pocket_min_size);
  }
  site.box = grid_box(pb.center(), size);
  site.cavity_points = nearby.size();
  site.confidence = std::min(fl(nearby.size()) / 20, fl(1));
  site.label = pocket_label(site.confidence);
  return site;
}

namespace {
//atoms gathered for one candidate site, in first-seen order
struct site_group {
    std::string label;
    std::string description;
    vecv coords;
};

struct site_residue {
    char chain;
    int res_seq;
};
}

//solvent and common ions are never a ligand site
static bool ignored_het(const std::string& res_name) {
  static const boost::unordered_set<std::string> hets = boost::assign::list_of
      ("HOH")("WAT")("TIP")("SOL")("NA")("CL")("K")("MG")("CA")("ZN")("MN")("FE");
  return hets.count(res_name) > 0;
}

//centroid of the coordinates, extent plus a fixed margin
static grid_box site_box(const vecv& coords) {
  vec sum(0, 0, 0);
  for (sz i = 0; i < coords.size(); i++)
    sum = sum + coords[i];
  fl n = fl(coords.size());
  vec span = bounding_box(coords).span();
  return grid_box(vec(sum[0] / n, sum[1] / n, sum[2] / n),
      vec(span[0] + known_site_padding, span[1] + known_site_padding,
          span[2] + known_site_padding));
}

//SITE records list up to four residues per line as name, chain, number
static void parse_site_record(const std::string& line, std::vector<std::string>& ids,
    std::vector<std::vector<site_residue> >& residues) {
  std::string id = column_text(line, 12, 14);
  sz which = 0;
  while (which < ids.size() && ids[which] != id)
    which++;
  if (which == ids.size()) {
    ids.push_back(id);
    residues.push_back(std::vector<site_residue>());
  }

  const sz offsets[] = { 18, 29, 40, 51 };
  for (unsigned k = 0; k < 4; k++) {
    sz off = offsets[k];
    if (line.size() <= off + 10) break;
    if (column_text(line, off + 1, off + 3).empty()) continue;
    site_residue r;
    r.chain = line[off + 4];
    try {
      r.res_seq = boost::lexical_cast<int>(column_text(line, off + 6, off + 9));
    } catch (boost::bad_lexical_cast&) {
      continue;
    }
    residues[which].push_back(r);
  }
}

known_sites find_known_sites(const std::string& pdb_text) {
  std::vector<std::string> site_ids;
  std::vector<std::vector<site_residue> > site_residues;
  pdbqt_atoms atoms;

  std::istringstream in(pdb_text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);
    if (starts_with(line, "SITE ")) {
      parse_site_record(line, site_ids, site_residues);
    } else {
      pdbqt_atom a;
      if (parse_atom_record(line, a)) atoms.push_back(a);
    }
  }

  std::vector<site_group> groups;
  for (sz s = 0; s < site_ids.size(); s++) {
    site_group g;
    g.label = "Site " + site_ids[s];
    g.description = "site record " + site_ids[s] + " ("
        + boost::lexical_cast<std::string>(site_residues[s].size()) + " residues)";
    for (sz i = 0; i < atoms.size(); i++) {
      for (sz r = 0; r < site_residues[s].size(); r++) {
        if (atoms[i].chain_id == site_residues[s][r].chain
            && atoms[i].res_seq == site_residues[s][r].res_seq) {
          g.coords.push_back(atoms[i].coords);
          break;
        }
      }
    }
    if (!g.coords.empty()) groups.push_back(g);
  }

  //one ligand per residue name, chain and number
  std::vector<site_group> ligands;
  std::vector<const pdbqt_atom*> ligand_keys;
  for (sz i = 0; i < atoms.size(); i++) {
    const pdbqt_atom& a = atoms[i];
    if (a.record != "HETATM" || ignored_het(a.res_name)) continue;
    sz which = 0;
    while (which < ligand_keys.size()
        && !(ligand_keys[which]->res_name == a.res_name
            && ligand_keys[which]->chain_id == a.chain_id
            && ligand_keys[which]->res_seq == a.res_seq))
      which++;
    if (which == ligand_keys.size()) {
      ligand_keys.push_back(&a);
      site_group g;
      g.label = "Ligand " + a.res_name;
      g.description = "chain " + std::string(1, a.chain_id) + ", residue "
          + boost::lexical_cast<std::string>(a.res_seq);
      ligands.push_back(g);
    }
    ligands[which].coords.push_back(a.coords);
  }
  for (sz l = 0; l < ligands.size(); l++) {
    if (ligands[l].coords.size() < known_site_min_ligand_atoms) continue;
    ligands[l].description += " (" + boost::lexical_cast<std::string>(ligands[l].coords.size())
        + " atoms)";
    groups.push_back(ligands[l]);
  }

  known_sites ret;
  for (sz g = 0; g < groups.size(); g++) {
    grid_box box = site_box(groups[g].coords);
    bool duplicate = false;
    for (sz k = 0; k < ret.size(); k++) {
      if (vec_distance_sqr(box.center, ret[k].box.center)
          < known_site_merge_distance * known_site_merge_distance) {
        duplicate = true;
        break;
      }
    }
    if (duplicate) continue;
    known_site site;
    site.label = groups[g].label;
    site.description = groups[g].description;
    site.box = box;
    ret.push_back(site);
  }
  return ret;
}
