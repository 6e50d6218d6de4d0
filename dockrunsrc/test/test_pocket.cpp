#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include "test_pocket.h"
#include "test_utils.h"
#include "pocket.h"

void test_pocket_too_few_atoms() {
  p_args.log << "Pocket with too few atoms\n";
  pdbqt_atoms atoms;
  for (unsigned i = 0; i < pocket_min_atoms - 1; i++)
    atoms.push_back(make_atom(i, 0, 0));
  BOOST_CHECK(!detect_pocket(atoms));
  BOOST_CHECK(!detect_pocket(pdbqt_atoms()));
}

void test_pocket_cavity() {
  p_args.log << "Pocket in a hollow block\n";
  //a 30A block of atoms with a spherical hole of radius 10 in the middle
  pdbqt_atoms atoms;
  vec hole(15, 15, 15);
  for (int x = 0; x <= 30; x += 2) {
    for (int y = 0; y <= 30; y += 2) {
      for (int z = 0; z <= 30; z += 2) {
        vec v(x, y, z);
        if ((v - hole).norm() < 10) continue;
        atoms.push_back(make_atom(x, y, z));
      }
    }
  }
  p_args.log << "  " << atoms.size() << " atoms\n";

  boost::optional<pocket_site> site = detect_pocket(atoms);
  BOOST_REQUIRE(site);
  BOOST_CHECK_EQUAL(site->label, "deep-cavity");
  BOOST_CHECK_CLOSE(site->confidence, 1.0, 1e-6);
  BOOST_CHECK_EQUAL(site->cavity_points, 20U);
  BOOST_CHECK(site->box.contains(hole));
  for (unsigned i = 0; i < 3; i++) {
    BOOST_CHECK_SMALL(site->box.center[i] - 15, 0.5);
    BOOST_CHECK(site->box.size[i] >= pocket_min_size);
    BOOST_CHECK(site->box.size[i] < 30);
  }
}

void test_pocket_fallback() {
  p_args.log << "Pocket fallback\n";
  //a compact cluster has no enclosed empty space
  pdbqt_atoms atoms;
  for (int x = 0; x < 3; x++)
    for (int y = 0; y < 3; y++)
      for (int z = 0; z < 3; z++)
        atoms.push_back(make_atom(x * 1.5, y * 1.5, z * 1.5));

  boost::optional<pocket_site> site = detect_pocket(atoms);
  BOOST_REQUIRE(site);
  BOOST_CHECK_EQUAL(site->label, "center-fallback");
  BOOST_CHECK_CLOSE(site->confidence, pocket_fallback_confidence, 1e-6);
  BOOST_CHECK_EQUAL(site->cavity_points, 0U);
  for (unsigned i = 0; i < 3; i++) {
    BOOST_CHECK_SMALL(site->box.center[i] - 1.5, 1e-9);
    BOOST_CHECK_SMALL(site->box.size[i] - pocket_fallback_size, 1e-9);
  }
}

void test_pocket_huge_extent() {
  p_args.log << "Pocket for a receptor too spread out to grid\n";
  pdbqt_atoms atoms;
  for (unsigned i = 0; i < pocket_min_atoms + 1; i++)
    atoms.push_back(make_atom(i, i % 3, i % 5));
  atoms.push_back(make_atom(9999.999, 9999.999, 9999.999));
  atoms.push_back(make_atom(-999.999, -999.999, -999.999));

  boost::optional<pocket_site> site;
  BOOST_REQUIRE_NO_THROW(site = detect_pocket(atoms));
  BOOST_REQUIRE(site);
  BOOST_CHECK_EQUAL(site->label, "center-fallback");
  BOOST_CHECK(site->box.valid());
  for (unsigned i = 0; i < 3; i++) {
    BOOST_CHECK_SMALL(site->box.center[i] - 4500, 1e-6);
    BOOST_CHECK_SMALL(site->box.size[i] - pocket_fallback_size, 1e-9);
  }

  //one long axis is enough
  pdbqt_atoms rod;
  for (unsigned i = 0; i < pocket_min_atoms; i++)
    rod.push_back(make_atom(0, 0, i * 300000.0));
  site = detect_pocket(rod);
  BOOST_REQUIRE(site);
  BOOST_CHECK_EQUAL(site->label, "center-fallback");
}

static std::string atom_line(const char* record, int serial, const char* name, const char* res,
    char chain, int seq, fl x, fl y, fl z) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "%-6s%5d %-4s %3s %c%4d    %8.3f%8.3f%8.3f  1.00 20.00\n",
      record, serial, name, res, chain, seq, x, y, z);
  return buf;
}

//SITE line with up to four residues, padded to the full record width
static std::string site_line(int seq, const char* id, const std::string& residues) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "SITE   %3d %3s %2d", seq, id,
      int(residues.size() / 11));
  std::string line = buf + residues;
  line.resize(80, ' ');
  return line + "\n";
}

static std::string site_residue(const char* res, char chain, int seq) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), " %3s %c%4d ", res, chain, seq);
  return buf;
}

void test_known_sites() {
  p_args.log << "Known sites from SITE records and ligands\n";
  std::string text = "HEADER    KNOWN SITES\n";
  text += site_line(1, "AC1", site_residue("HIS", 'A', 2) + site_residue("TYR", 'A', 3));
  text += site_line(1, "AC2", site_residue("GLY", 'B', 99)); //no such residue
  text += atom_line("ATOM", 1, "N", "ALA", 'A', 1, 0, 0, 0);
  text += atom_line("ATOM", 2, "CA", "ALA", 'A', 1, 1, 0, 0);
  text += atom_line("ATOM", 3, "N", "HIS", 'A', 2, 9, 10, 10);
  text += atom_line("ATOM", 4, "CA", "HIS", 'A', 2, 11, 10, 10);
  text += atom_line("ATOM", 5, "N", "TYR", 'A', 3, 10, 9, 10);
  text += atom_line("ATOM", 6, "CA", "TYR", 'A', 3, 10, 11, 10);
  text += "TER\n";
  //bound ligand, centroid (30,30,30)
  text += atom_line("HETATM", 7, "C1", "ATP", 'A', 401, 29, 30, 30);
  text += atom_line("HETATM", 8, "C2", "ATP", 'A', 401, 31, 30, 30);
  text += atom_line("HETATM", 9, "C3", "ATP", 'A', 401, 30, 29, 30);
  text += atom_line("HETATM", 10, "C4", "ATP", 'A', 401, 30, 31, 30);
  text += atom_line("HETATM", 11, "C5", "ATP", 'A', 401, 30, 30, 29);
  text += atom_line("HETATM", 12, "C6", "ATP", 'A', 401, 30, 30, 31);
  //fragment too small to count
  text += atom_line("HETATM", 13, "C1", "ACT", 'A', 402, 40, 40, 40);
  text += atom_line("HETATM", 14, "C2", "ACT", 'A', 402, 41, 40, 40);
  text += atom_line("HETATM", 15, "O1", "ACT", 'A', 402, 40, 41, 40);
  //solvent and ions, however many atoms
  for (int i = 0; i < 6; i++)
    text += atom_line("HETATM", 16 + i, "O", "HOH", 'A', 501, 50 + i, 50, 50);
  text += atom_line("HETATM", 22, "ZN", "ZN", 'A', 502, 60, 60, 60);
  //ligand sitting in the AC1 site, centroid (10.5,10,10)
  text += atom_line("HETATM", 23, "C1", "LIG", 'B', 403, 9.5, 10, 10);
  text += atom_line("HETATM", 24, "C2", "LIG", 'B', 403, 11.5, 10, 10);
  text += atom_line("HETATM", 25, "C3", "LIG", 'B', 403, 10.5, 9, 10);
  text += atom_line("HETATM", 26, "C4", "LIG", 'B', 403, 10.5, 11, 10);
  text += atom_line("HETATM", 27, "C5", "LIG", 'B', 403, 10.5, 10, 10);
  text += "END\n";

  known_sites sites = find_known_sites(text);
  BOOST_REQUIRE_EQUAL(sites.size(), 2U);

  BOOST_CHECK_EQUAL(sites[0].label, "Site AC1");
  BOOST_CHECK_EQUAL(sites[0].description, "site record AC1 (2 residues)");
  const fl site_size[] = { 12, 12, 10 };
  for (unsigned i = 0; i < 3; i++) {
    BOOST_CHECK_SMALL(sites[0].box.center[i] - 10, 1e-9);
    BOOST_CHECK_SMALL(sites[0].box.size[i] - site_size[i], 1e-9);
  }

  BOOST_CHECK_EQUAL(sites[1].label, "Ligand ATP");
  BOOST_CHECK_EQUAL(sites[1].description, "chain A, residue 401 (6 atoms)");
  for (unsigned i = 0; i < 3; i++) {
    BOOST_CHECK_SMALL(sites[1].box.center[i] - 30, 1e-9);
    BOOST_CHECK_SMALL(sites[1].box.size[i] - 12, 1e-9);
  }

  //without the SITE records the ligand in AC1 is no longer a duplicate
  std::string unrecorded = text.substr(text.find("ATOM"));
  sites = find_known_sites(unrecorded);
  BOOST_REQUIRE_EQUAL(sites.size(), 2U);
  BOOST_CHECK_EQUAL(sites[0].label, "Ligand ATP");
  BOOST_CHECK_EQUAL(sites[1].label, "Ligand LIG");
  BOOST_CHECK_SMALL(sites[1].box.center[0] - 10.5, 1e-9);

  //only water and zinc in the sample
  BOOST_CHECK(find_known_sites(sample_pdb()).empty());
  BOOST_CHECK(find_known_sites("").empty());
}
