#pragma once
#include "common.h"
#include <string>
#include <boost/optional.hpp>

//how the search space is chosen when no explicit box is given
enum autobox_mode {
  AutoboxNone, AutoboxBlind, AutoboxPocket, AutoboxSite, AutoboxResidues, AutoboxLigand
};

//for reading in as a commandline option
std::istream& operator>>(std::istream& in, autobox_mode& mode);
std::ostream& operator<<(std::ostream& out, autobox_mode mode);

//engine search settings passed through on the command line
struct search_params {
    int exhaustiveness;
    int num_modes;
    fl energy_range;
    boost::optional<int> seed; //engine picks one if unset

    //reasonable defaults
    search_params()
        : exhaustiveness(8), num_modes(9), energy_range(3) {
    }
};

//throws usage_error for values the engine would reject
void check_search_params(const search_params& params);
