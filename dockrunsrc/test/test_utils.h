#ifndef TEST_UTILS_H
#define TEST_UTILS_H

#include <string>
#include <boost/filesystem/path.hpp>
#include "parsed_args.h"
#include "pdbqt.h"

extern parsed_args p_args;

//two residues of a protein plus a water and a zinc, as a PDB file
std::string sample_pdb();

//the atom records of sample_pdb (ATOM and HETATM lines)
unsigned sample_pdb_atom_count();

//atom with only coordinates and residue set
pdbqt_atom make_atom(fl x, fl y, fl z, const std::string& res_name = "ALA", int res_seq = 1);

//a scratch directory of /bin/sh scripts standing in for the docking engine;
//removed on destruction
class mock_engines {
    boost::filesystem::path dir;

    mock_engines(const mock_engines&);
    mock_engines& operator=(const mock_engines&);
  public:
    mock_engines();
    ~mock_engines();

    const boost::filesystem::path& directory() const {
      return dir;
    }

    //write an executable script, returns its path
    std::string write(const std::string& name, const std::string& body);

    //prints its arguments and a two mode result table, writes two poses to --out
    std::string well_behaved();
    //writes to stderr and exits with status 3
    std::string crashing();
    //exits cleanly without writing anything
    std::string silent();
    //records its pid in pidfile then sleeps well past any test timeout
    std::string stalling(const boost::filesystem::path& pidfile);
};

#endif
