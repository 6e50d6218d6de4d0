#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include "test_atom_typing.h"
#include "test_utils.h"
#include "atom_typing.h"

void test_residue_types() {
  p_args.log << "Residue atom types\n";
  BOOST_CHECK_EQUAL(assign_atom_type("ALA", "CB"), "C");
  BOOST_CHECK_EQUAL(assign_atom_type("PHE", "CZ"), "A");
  BOOST_CHECK_EQUAL(assign_atom_type("TYR", "OH"), "OA");
  BOOST_CHECK_EQUAL(assign_atom_type("HIS", "ND1"), "NA");
  BOOST_CHECK_EQUAL(assign_atom_type("HID", "ND1"), "N");
  BOOST_CHECK_EQUAL(assign_atom_type("HIE", "NE2"), "N");
  BOOST_CHECK_EQUAL(assign_atom_type("MET", "SD"), "SA");
  BOOST_CHECK_EQUAL(assign_atom_type("CYS", "SG"), "SA");
  BOOST_CHECK_EQUAL(assign_atom_type("LYS", "NZ"), "N");
  BOOST_CHECK_EQUAL(assign_atom_type("ASP", "OD2"), "OA");
  BOOST_CHECK_EQUAL(assign_atom_type("ZN", "ZN"), "Zn");
  //case and padding don't matter
  BOOST_CHECK_EQUAL(assign_atom_type(" phe", "cd1 "), "A");
}

void test_backbone_types() {
  p_args.log << "Backbone atom types\n";
  BOOST_CHECK_EQUAL(assign_atom_type("GLY", "N"), "N");
  BOOST_CHECK_EQUAL(assign_atom_type("GLY", "CA"), "C");
  BOOST_CHECK_EQUAL(assign_atom_type("SER", "C"), "C");
  BOOST_CHECK_EQUAL(assign_atom_type("SER", "O"), "OA");
  BOOST_CHECK_EQUAL(assign_atom_type("VAL", "OXT"), "OA");
  //backbone names apply to unknown residues too
  BOOST_CHECK_EQUAL(assign_atom_type("HOH", "O"), "OA");
  //proline's own table wins over the backbone
  BOOST_CHECK_EQUAL(assign_atom_type("PRO", "N"), "N");
}

void test_name_inference() {
  p_args.log << "Atom type from name\n";
  BOOST_CHECK_EQUAL(infer_type_from_name("C12"), "C");
  BOOST_CHECK_EQUAL(infer_type_from_name("N3"), "N");
  BOOST_CHECK_EQUAL(infer_type_from_name("O1"), "OA");
  BOOST_CHECK_EQUAL(infer_type_from_name("S"), "SA");
  BOOST_CHECK_EQUAL(infer_type_from_name("CL1"), "Cl");
  BOOST_CHECK_EQUAL(infer_type_from_name("Br"), "Br");
  BOOST_CHECK_EQUAL(infer_type_from_name("F2"), "F");
  BOOST_CHECK_EQUAL(infer_type_from_name("P"), "P");
  BOOST_CHECK_EQUAL(infer_type_from_name("I1"), "I");
  BOOST_CHECK_EQUAL(infer_type_from_name("1HB"), "HD");
  BOOST_CHECK_EQUAL(infer_type_from_name("h2"), "HD");
  BOOST_CHECK_EQUAL(infer_type_from_name("XX"), default_ad_type);
  BOOST_CHECK_EQUAL(infer_type_from_name("12"), default_ad_type);
  BOOST_CHECK_EQUAL(infer_type_from_name(""), default_ad_type);

  //unknown residues fall through to the name
  BOOST_CHECK_EQUAL(assign_atom_type("LIG", "CL3"), "Cl");
  BOOST_CHECK_EQUAL(assign_atom_type("UNL", "Q1"), default_ad_type);
}
