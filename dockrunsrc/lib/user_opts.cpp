#include "user_opts.h"
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

using namespace boost::algorithm;
using namespace boost::program_options;

std::istream& operator>>(std::istream& in, autobox_mode& mode) {
  std::string token;
  in >> token;
  to_lower(token);
  if (token == "none")
    mode = AutoboxNone;
  else if (token == "blind")
    mode = AutoboxBlind;
  else if (token == "pocket")
    mode = AutoboxPocket;
  else if (token == "site" || token == "known")
    mode = AutoboxSite;
  else if (starts_with(token, "res"))
    mode = AutoboxResidues;
  else if (starts_with(token, "lig"))
    mode = AutoboxLigand;
  else
    throw validation_error(validation_error::invalid_option_value);
  return in;
}

std::ostream& operator<<(std::ostream& out, autobox_mode mode) {
  switch (mode) {
  case AutoboxNone:
    return out << "none";
  case AutoboxBlind:
    return out << "blind";
  case AutoboxPocket:
    return out << "pocket";
  case AutoboxSite:
    return out << "site";
  case AutoboxResidues:
    return out << "residues";
  case AutoboxLigand:
    return out << "ligand";
  }
  return out;
}

void check_search_params(const search_params& params) {
  if (params.exhaustiveness < 1)
    throw usage_error("exhaustiveness must be 1 or greater");
  if (params.num_modes < 1)
    throw usage_error("num_modes must be 1 or greater");
  if (!(params.energy_range > 0))
    throw usage_error("energy_range must be positive");
}
