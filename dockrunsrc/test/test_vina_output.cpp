#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <boost/algorithm/string.hpp>
#include "test_vina_output.h"
#include "test_utils.h"
#include "vina_output.h"

static const char* vina_log =
    "Computing Vina grid ... done.\n"
    "Performing docking (random seed: 42) ... \n"
    "0%   10   20   30   40   50   60   70   80   90   100%\n"
    "|----|----|----|----|----|----|----|----|----|----|\n"
    "***************************************************\n"
    "\n"
    "mode |   affinity | dist from best mode\n"
    "     | (kcal/mol) | rmsd l.b.| rmsd u.b.\n"
    "-----+------------+----------+----------\n"
    "   1       -9.100          0          0\n"
    "   2       -8.750      1.872      2.915\n"
    "   3       -8.300      2.010      7.332\n"
    "\n"
    "Writing output ... done.\n";

static std::string model(int n, const std::string& affinity) {
  std::ostringstream out;
  out << "MODEL " << n << "\n"
      << "REMARK VINA RESULT:    " << affinity << "      0.000      0.000\n"
      << "ATOM      1  C   UNL     1       1.000   2.000   3.000  0.00  0.00    +0.000 C \n"
      << "ENDMDL\n";
  return out.str();
}

static void check_row(const affinity_row& row, int mode, fl affinity, fl lb, fl ub) {
  BOOST_CHECK_EQUAL(row.mode, mode);
  BOOST_CHECK_SMALL(row.affinity - affinity, 1e-9);
  BOOST_CHECK_SMALL(row.rmsd_lb - lb, 1e-9);
  BOOST_CHECK_SMALL(row.rmsd_ub - ub, 1e-9);
}

void test_affinity_table() {
  p_args.log << "Affinity table\n";
  std::vector<affinity_row> rows = parse_affinity_table(
      "mode |   affinity\n-----\n   1  -7.2  0.0  0.0\n   2  -6.8  1.1  2.3\n\n");
  BOOST_REQUIRE_EQUAL(rows.size(), 2U);
  check_row(rows[0], 1, -7.2, 0, 0);
  check_row(rows[1], 2, -6.8, 1.1, 2.3);

  rows = parse_affinity_table(vina_log);
  BOOST_REQUIRE_EQUAL(rows.size(), 3U);
  check_row(rows[0], 1, -9.1, 0, 0);
  check_row(rows[2], 3, -8.3, 2.01, 7.332);

  //short, unreadable and out of table rows are skipped
  rows = parse_affinity_table(
      "1 -5.0 0 0\n"
      "mode | affinity\n"
      "   1  -7.2\n"
      "   2  abc  0 0\n"
      "   3  -6.1  n/a  0\n"
      "\n"
      "   4  -6.0  0 0\n");
  BOOST_REQUIRE_EQUAL(rows.size(), 1U);
  check_row(rows[0], 3, -6.1, 0, 0);

  BOOST_CHECK(parse_affinity_table("").empty());
  BOOST_CHECK(parse_affinity_table("no table here\n").empty());
}

void test_split_poses() {
  p_args.log << "Split poses\n";
  std::string structure = model(1, "-9.100") + model(2, "-8.750") + model(3, "-8.300");
  std::vector<std::string> blocks = split_poses(structure);
  BOOST_REQUIRE_EQUAL(blocks.size(), 3U);
  for (unsigned i = 0; i < blocks.size(); i++) {
    BOOST_CHECK(starts_with(blocks[i], "MODEL"));
    BOOST_CHECK(boost::algorithm::ends_with(blocks[i], "ENDMDL"));
  }
  BOOST_CHECK(blocks[1].find("-8.750") != std::string::npos);

  //no markers, the whole output is one pose
  std::string single = "REMARK VINA RESULT:    -5.0 0 0\nATOM      1  C\n";
  blocks = split_poses(single);
  BOOST_REQUIRE_EQUAL(blocks.size(), 1U);
  BOOST_CHECK_EQUAL(blocks[0], single);

  BOOST_CHECK(split_poses("").empty());
  BOOST_CHECK(split_poses(" \n\n").empty());

  //an unterminated model is dropped
  blocks = split_poses(model(1, "-9.100") + "MODEL 2\nATOM\n");
  BOOST_CHECK_EQUAL(blocks.size(), 1U);
}

void test_assemble() {
  p_args.log << "Assemble result\n";
  std::string structure = model(1, "-9.100") + model(2, "-8.750") + model(3, "-8.300");
  docking_result result = assemble(vina_log, structure);
  BOOST_REQUIRE_EQUAL(result.poses.size(), 3U);
  BOOST_CHECK_EQUAL(result.poses[0].mode, 1);
  BOOST_CHECK_SMALL(result.poses[1].affinity + 8.75, 1e-9);
  BOOST_CHECK(result.poses[2].structure.find("MODEL 3") != std::string::npos);
  BOOST_CHECK_EQUAL(result.raw_log, vina_log);
  BOOST_CHECK_EQUAL(result.raw_structure, structure);

  //the shorter list wins
  result = assemble(vina_log, model(1, "-9.100"));
  BOOST_CHECK_EQUAL(result.poses.size(), 1U);
  result = assemble("", structure);
  BOOST_CHECK(result.poses.empty());
  BOOST_CHECK_EQUAL(result.raw_structure, structure);
}

void test_cross_check() {
  p_args.log << "Affinity cross check\n";
  boost::optional<fl> a = extract_affinity_from_block(model(1, "-9.100"));
  BOOST_REQUIRE(a);
  BOOST_CHECK_SMALL(*a + 9.1, 1e-9);
  BOOST_CHECK(!extract_affinity_from_block("MODEL 1\nENDMDL"));

  std::string structure = model(1, "-9.100") + model(2, "-7.000") + model(3, "-8.300");
  docking_result result = assemble(vina_log, structure);
  std::vector<int> bad = cross_check_affinities(result);
  BOOST_REQUIRE_EQUAL(bad.size(), 1U);
  BOOST_CHECK_EQUAL(bad[0], 2);

  BOOST_CHECK(cross_check_affinities(result, 2.0).empty());
  BOOST_CHECK(cross_check_affinities(assemble(vina_log,
      model(1, "-9.100") + model(2, "-8.750") + model(3, "-8.300"))).empty());
}
