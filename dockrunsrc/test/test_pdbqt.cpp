#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <sstream>
#include "test_pdbqt.h"
#include "test_utils.h"
#include "pdbqt.h"
#include "box.h"

static std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> ret;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line))
    ret.push_back(line);
  return ret;
}

void test_parse_atom_fields() {
  p_args.log << "Parse atom fields\n";
  pdbqt_atoms atoms = parse_atoms(sample_pdb());
  BOOST_REQUIRE_EQUAL(atoms.size(), sample_pdb_atom_count());

  const pdbqt_atom& n = atoms[0];
  BOOST_CHECK_EQUAL(n.record, "ATOM");
  BOOST_CHECK_EQUAL(n.serial, 1);
  BOOST_CHECK_EQUAL(n.name, "N");
  BOOST_CHECK_EQUAL(n.res_name, "ALA");
  BOOST_CHECK_EQUAL(n.chain_id, 'A');
  BOOST_CHECK_EQUAL(n.res_seq, 1);
  BOOST_CHECK_CLOSE(n.coords[0], 11.104, 1e-6);
  BOOST_CHECK_CLOSE(n.coords[1], 6.134, 1e-6);
  BOOST_CHECK_CLOSE(n.coords[2], -6.504, 1e-6);
  BOOST_CHECK_CLOSE(n.occupancy, 1.0, 1e-6);
  BOOST_CHECK_CLOSE(n.temp_factor, 20.0, 1e-6);
  BOOST_CHECK(n.ad_type.empty());

  const pdbqt_atom& zn = atoms.back();
  BOOST_CHECK_EQUAL(zn.record, "HETATM");
  BOOST_CHECK_EQUAL(zn.name, "ZN");
  BOOST_CHECK_EQUAL(zn.res_name, "ZN");
  BOOST_CHECK_EQUAL(zn.res_seq, 102);
  BOOST_CHECK_CLOSE(zn.coords[1], -10.0, 1e-6);
  BOOST_CHECK_CLOSE(zn.coords[2], 100.125, 1e-6);

  pdbqt_atom typed;
  BOOST_REQUIRE(parse_atom_record(
      "ATOM      1  C   UNL     1       1.000   2.000   3.000  0.00  0.00    +0.125 C ", typed));
  BOOST_CHECK_CLOSE(typed.partial_charge, 0.125, 1e-6);
  BOOST_CHECK_EQUAL(typed.ad_type, "C");
}

void test_malformed_lines_skipped() {
  p_args.log << "Malformed atom records\n";
  std::string text =
      "ATOM      1  N   ALA A   1      11.104   6.134  -6.504  1.00 20.00           N\n"
      "ATOM      2  CA  ALA A   1      11.639   6.0\n" //truncated
      "ATOM      3  C   ALA A   1      13.1x9   5.826  -5.218  1.00 20.00           C\n"
      "REMARK  not an atom\n"
      "ATOM      4  O   ALA A   1      13.814   6.289  -6.142  1.00 20.00           O\r\n";
  pdbqt_atoms atoms = parse_atoms(text);
  BOOST_REQUIRE_EQUAL(atoms.size(), 2U);
  BOOST_CHECK_EQUAL(atoms[0].serial, 1);
  BOOST_CHECK_EQUAL(atoms[1].serial, 4);

  pdbqt_atom a;
  BOOST_CHECK(!parse_atom_record("REMARK  not an atom", a));
  BOOST_CHECK(parse_atoms("").empty());

  //numeric text that is not a finite coordinate
  std::string nonfinite =
      "ATOM      1  N   ALA A   1      11.104   6.134  -6.504  1.00 20.00           N\n"
      "ATOM      2  CA  ALA A   1         nan   6.000  -5.000  1.00 20.00           C\n"
      "ATOM      3  C   ALA A   1      13.000     inf  -5.218  1.00 20.00           C\n"
      "ATOM      4  O   ALA A   1      13.814   6.289    -inf  1.00 20.00           O\n"
      "ATOM      5  CB  ALA A   1      12.000   7.000  -7.000  1.00 20.00           C\n";
  BOOST_CHECK(!parse_atom_record(lines_of(nonfinite)[1], a));
  BOOST_CHECK(!parse_atom_record(lines_of(nonfinite)[2], a));
  BOOST_CHECK(!parse_atom_record(lines_of(nonfinite)[3], a));
  atoms = parse_atoms(nonfinite);
  BOOST_REQUIRE_EQUAL(atoms.size(), 2U);
  BOOST_CHECK_EQUAL(atoms[0].serial, 1);
  BOOST_CHECK_EQUAL(atoms[1].serial, 5);
  BOOST_CHECK(blind_box(atoms).valid());

  //conversion drops the same lines
  std::vector<std::string> converted = lines_of(convert_to_pdbqt(nonfinite));
  BOOST_REQUIRE_EQUAL(converted.size(), 2U);
  BOOST_CHECK_EQUAL(converted[1].substr(12, 4), " CB ");
}

void test_convert_to_pdbqt() {
  p_args.log << "Convert PDB to PDBQT\n";
  std::string converted = convert_to_pdbqt(sample_pdb());
  std::vector<std::string> lines = lines_of(converted);

  //header and remark records are dropped, TER and END pass through
  BOOST_REQUIRE_EQUAL(lines.size(), sample_pdb_atom_count() + 2);
  BOOST_CHECK_EQUAL(lines[9].substr(0, 3), "TER");
  BOOST_CHECK_EQUAL(lines.back(), "END");

  for (unsigned i = 0; i < lines.size(); i++) {
    if (!is_atom_record(lines[i])) continue;
    BOOST_CHECK_EQUAL(lines[i].size(), 79U);
    BOOST_CHECK_EQUAL(lines[i].substr(70, 6), " 0.000");
  }

  pdbqt_atoms before = parse_atoms(sample_pdb());
  pdbqt_atoms after = parse_atoms(converted);
  BOOST_REQUIRE_EQUAL(before.size(), after.size());
  for (unsigned i = 0; i < before.size(); i++) {
    for (unsigned k = 0; k < 3; k++)
      BOOST_CHECK_EQUAL(before[i].coords[k], after[i].coords[k]);
    BOOST_CHECK_EQUAL(before[i].name, after[i].name);
    BOOST_CHECK_EQUAL(before[i].res_seq, after[i].res_seq);
  }

  //coordinate text is copied verbatim
  BOOST_CHECK_EQUAL(lines[0].substr(30, 24), "  11.104   6.134  -6.504");

  BOOST_CHECK_EQUAL(after[0].ad_type, "N");
  BOOST_CHECK_EQUAL(after[1].ad_type, "C");
  BOOST_CHECK_EQUAL(after[3].ad_type, "OA");
  BOOST_CHECK_EQUAL(after[4].ad_type, "C");
  BOOST_CHECK_EQUAL(after[7].ad_type, "NA");
  BOOST_CHECK_EQUAL(after[8].ad_type, "NA");
  BOOST_CHECK_EQUAL(after[9].ad_type, "OA");
  BOOST_CHECK_EQUAL(after[10].ad_type, "Zn");

  BOOST_CHECK(convert_to_pdbqt("").empty());
}

void test_is_valid_pdbqt() {
  p_args.log << "PDBQT validity\n";
  std::string converted = convert_to_pdbqt(sample_pdb());
  BOOST_CHECK(is_valid_pdbqt(converted));
  BOOST_CHECK(!is_valid_pdbqt(sample_pdb()));
  BOOST_CHECK(!is_valid_pdbqt(""));
  BOOST_CHECK(!is_valid_pdbqt("REMARK nothing here\nEND\n"));
  BOOST_CHECK(!is_valid_pdbqt("HEADER    TEST\n" + converted));
  BOOST_CHECK(!is_valid_pdbqt("COMPND    TEST\n" + converted));

  //plain PDB atom records without the header are still not PDBQT
  std::string plain = remove_non_polymer_atoms(sample_pdb());
  BOOST_CHECK(!is_valid_pdbqt(plain.substr(plain.find("ATOM"))));
}

void test_remove_non_polymer() {
  p_args.log << "Remove non-polymer atoms\n";
  std::string stripped = remove_non_polymer_atoms(sample_pdb());
  pdbqt_atoms atoms = parse_atoms(stripped);
  BOOST_CHECK_EQUAL(atoms.size(), 9U);
  for (unsigned i = 0; i < atoms.size(); i++) {
    BOOST_CHECK(atoms[i].res_name == "ALA" || atoms[i].res_name == "HIS");
  }
  BOOST_CHECK(stripped.find("HOH") == std::string::npos);
  BOOST_CHECK(stripped.find("TER") != std::string::npos);
  BOOST_CHECK(stripped.find("HEADER") != std::string::npos);
}

void test_prepare_receptor() {
  p_args.log << "Prepare receptor\n";
  std::string prepared = prepare_receptor(sample_pdb());
  BOOST_CHECK(is_valid_pdbqt(prepared));
  pdbqt_atoms atoms = parse_atoms(prepared);
  BOOST_REQUIRE_EQUAL(atoms.size(), 9U);
  for (unsigned i = 0; i < atoms.size(); i++)
    BOOST_CHECK(!atoms[i].ad_type.empty());

  //already valid input only loses its non-polymer atoms
  std::string converted = convert_to_pdbqt(sample_pdb());
  std::string again = prepare_receptor(converted);
  BOOST_CHECK_EQUAL(again, remove_non_polymer_atoms(converted));
}
