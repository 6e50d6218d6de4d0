/*
 * dockrunbox.cpp
 *
 *  Print suggested search spaces for a receptor in engine config syntax,
 *  ready to paste into a --config file.
 */

#include <iostream>
#include <string>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "common.h"
#include "file.h"
#include "pdbqt.h"
#include "box.h"
#include "pocket.h"
#include "ob_format_converter.h"

using namespace std;
using namespace boost::program_options;

static fl round2(fl v) {
  return floor(v * 100 + 0.5) / 100;
}

static void print_box(ostream& out, const string& title, const grid_box& box) {
  out << "# " << title << "\n";
  const char axes[] = { 'x', 'y', 'z' };
  for (unsigned i = 0; i < 3; i++)
    out << "center_" << axes[i] << " = " << round2(box.center[i]) << "\n";
  for (unsigned i = 0; i < 3; i++)
    out << "size_" << axes[i] << " = " << round2(box.size[i]) << "\n";
  out << "\n";
}

int main(int argc, char *argv[]) {
  string receptor_name, autobox_ligand, autobox_residues, config_name;
  fl padding = 0;
  bool help = false;

  options_description desc("dockrunbox");
  desc.add_options()
  ("receptor,r", value<string>(&receptor_name), "receptor (PDB or PDBQT)")
  ("autobox_ligand", value<string>(&autobox_ligand), "also box this ligand")
  ("autobox_residues", value<string>(&autobox_residues), "also box these residues, e.g. \"ASP25,HIS57\"")
  ("autobox_add", value<fl>(&padding), "padding for ligand and residue boxes (default 5)")
  ("config", value<string>(&config_name), "read options from this file")
  ("help", bool_switch(&help), "display usage summary");

  try {
    variables_map vm;
    try {
      store(parse_command_line(argc, argv, desc), vm);
      notify(vm);
      if (vm.count("config")) {
        ifile config_stream(config_name);
        store(parse_config_file(config_stream, desc), vm);
        notify(vm);
      }
    } catch (boost::program_options::error& e) {
      cerr << "Command line parse error: " << e.what() << '\n' << "\nCorrect usage:\n" << desc
          << '\n';
      return 1;
    }

    if (help) {
      cout << desc << '\n';
      return 0;
    }
    if (receptor_name.empty()) {
      cerr << "Missing receptor.\n" << "\nCorrect usage:\n" << desc << '\n';
      return 1;
    }
    if (!vm.count("autobox_add")) padding = default_ligand_padding;

    const std::string receptor_text = read_file(receptor_name);
    pdbqt_atoms receptor = parse_atoms(receptor_text);
    cout << "# " << receptor.size() << " receptor atoms\n\n";

    print_box(cout, "blind docking", blind_box(receptor));

    boost::optional<pocket_site> site = detect_pocket(receptor);
    if (site) {
      print_box(cout,
          "pocket: " + site->label + ", confidence "
              + boost::lexical_cast<string>(round2(site->confidence)), site->box);
    } else {
      cout << "# no pocket (fewer than " << pocket_min_atoms << " atoms)\n\n";
    }

    known_sites sites = find_known_sites(receptor_text);
    for (sz i = 0; i < sites.size(); i++)
      print_box(cout, sites[i].label + ": " + sites[i].description, sites[i].box);

    if (autobox_ligand.size() > 0) {
      string text;
      if (boost::ends_with(boost::to_lower_copy(autobox_ligand), ".pdbqt"))
        text = read_file(autobox_ligand);
      else {
        ob_format_converter converter;
        text = converter.file_to_pdbqt(autobox_ligand);
      }
      print_box(cout, "ligand " + autobox_ligand, ligand_box(parse_atoms(text), padding));
    }

    if (autobox_residues.size() > 0) {
      residue_box_result res = residue_centered_box(receptor, autobox_residues, padding);
      if (res.match_count == 0) throw usage_error(res.error);
      print_box(cout, "residues " + autobox_residues, res.box);
    }
  } catch (file_error& e) {
    cerr << "\n\nError: could not open \"" << e.name.string() << "\" for "
        << (e.in ? "reading" : "writing") << ".\n";
    return 1;
  } catch (usage_error& e) {
    cerr << "\n\nUsage error: " << e.what() << "\n";
    return 1;
  } catch (std::exception& e) {
    cerr << "\n\nAn error occurred: " << e.what() << "\n";
    return 1;
  } catch (internal_error& e) {
    cerr << "\n\nAn internal error occurred in " << e.file << "(" << e.line << ").\n";
    return 1;
  }
  return 0;
}
