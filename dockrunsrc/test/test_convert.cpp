#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include "test_convert.h"
#include "test_utils.h"
#include "ob_format_converter.h"
#include "file.h"

static const char* water_xyz =
    "3\n"
    "water\n"
    "O    0.000   0.000   0.000\n"
    "H    0.957   0.000   0.000\n"
    "H   -0.240   0.927   0.000\n";

void test_convert_xyz() {
  p_args.log << "Convert xyz to PDBQT\n";
  ob_format_converter converter;
  format_converter& conv = converter;
  pdbqt_atoms atoms = parse_atoms(conv.to_pdbqt(water_xyz, "xyz"));
  BOOST_REQUIRE(!atoms.empty());
  for (unsigned i = 0; i < atoms.size(); i++) {
    BOOST_CHECK(!atoms[i].ad_type.empty());
  }

  //the format can also come from a file name
  BOOST_CHECK(!parse_atoms(conv.to_pdbqt(water_xyz, "water.xyz")).empty());

  mock_engines scratch;
  boost::filesystem::path fname = scratch.directory() / "water.xyz";
  write_file(fname, water_xyz);
  BOOST_CHECK(!parse_atoms(converter.file_to_pdbqt(fname.string())).empty());
}

void test_convert_errors() {
  p_args.log << "Conversion errors\n";
  ob_format_converter converter;
  BOOST_CHECK_THROW(converter.to_pdbqt(water_xyz, "no-such-format"), usage_error);
  BOOST_CHECK_THROW(converter.to_pdbqt("", "xyz"), usage_error);

  mock_engines scratch;
  BOOST_CHECK_THROW(converter.file_to_pdbqt((scratch.directory() / "missing.xyz").string()),
      file_error);
  BOOST_CHECK_THROW(converter.file_to_pdbqt((scratch.directory() / "water.unknownext").string()),
      file_error);
}
