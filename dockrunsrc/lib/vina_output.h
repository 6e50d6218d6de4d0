/*
 * vina_output.h
 *
 *  Decoding of what a Vina compatible engine leaves behind: the result table
 *  printed to its log and the multi-model PDBQT written to --out.
 */

#ifndef DOCKRUN_VINA_OUTPUT_H
#define DOCKRUN_VINA_OUTPUT_H

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "common.h"

//one row of the "mode | affinity | dist from best mode" table
struct affinity_row {
    int mode;
    fl affinity; //kcal/mol
    fl rmsd_lb;
    fl rmsd_ub;

    affinity_row()
        : mode(0), affinity(0), rmsd_lb(0), rmsd_ub(0) {
    }
    affinity_row(int m, fl a, fl lb, fl ub)
        : mode(m), affinity(a), rmsd_lb(lb), rmsd_ub(ub) {
    }
};

struct pose {
    int mode;
    fl affinity;
    fl rmsd_lb;
    fl rmsd_ub;
    std::string structure; //MODEL..ENDMDL block

    pose()
        : mode(0), affinity(0), rmsd_lb(0), rmsd_ub(0) {
    }
    explicit pose(const affinity_row& row)
        : mode(row.mode), affinity(row.affinity), rmsd_lb(row.rmsd_lb), rmsd_ub(row.rmsd_ub) {
    }
};

//poses in the order the engine emitted them
struct docking_result {
    std::vector<pose> poses;
    std::string raw_structure;
    std::string raw_log;
};

//rows of every result table in log; malformed rows are skipped
std::vector<affinity_row> parse_affinity_table(const std::string& log);

//MODEL/ENDMDL blocks; unframed output is a single block, blank output none
std::vector<std::string> split_poses(const std::string& structure);

//pair table rows with structure blocks by position, up to the shorter list
docking_result assemble(const std::string& log, const std::string& structure);

//affinity from a block's REMARK VINA RESULT line
boost::optional<fl> extract_affinity_from_block(const std::string& block);

//modes whose embedded affinity differs from their table row by more than tolerance
std::vector<int> cross_check_affinities(const docking_result& result, fl tolerance = 0.01);

#endif /* DOCKRUN_VINA_OUTPUT_H */
