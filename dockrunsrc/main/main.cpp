#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "common.h"
#include "file.h"
#include "tee.h"
#include "pdbqt.h"
#include "box.h"
#include "pocket.h"
#include "user_opts.h"
#include "vina_output.h"
#include "ob_format_converter.h"
#include "JobController.h"

#ifndef DOCKRUN_VERSION
#define DOCKRUN_VERSION "unknown"
#endif

//PDBQT text for a ligand file, converting other formats with OpenBabel
static std::string load_ligand(const std::string& name) {
  std::string lower = boost::to_lower_copy(name);
  if (boost::ends_with(lower, ".pdbqt")) return read_file(name);
  ob_format_converter converter;
  return converter.file_to_pdbqt(name);
}

static fl round2(fl v) {
  return std::floor(v * 100 + 0.5) / 100;
}

static void print_box(tee& log, const std::string& what, const grid_box& box) {
  log << what << ": center (" << round2(box.center[0]) << ", " << round2(box.center[1]) << ", "
      << round2(box.center[2]) << ") size (" << round2(box.size[0]) << ", "
      << round2(box.size[1]) << ", " << round2(box.size[2]) << ")\n";
}

//same layout as the engine's own table
static void print_results(tee& log, const docking_result& result) {
  log << "mode |   affinity | dist from best mode\n";
  log << "     | (kcal/mol) | rmsd l.b.| rmsd u.b.\n";
  log << "-----+------------+----------+----------\n";
  for (sz i = 0; i < result.poses.size(); i++) {
    const pose& p = result.poses[i];
    std::ostringstream row;
    row.setf(std::ios::fixed, std::ios::floatfield);
    row << std::setw(4) << p.mode << std::setw(12) << std::setprecision(1) << p.affinity
        << std::setw(11) << std::setprecision(3) << p.rmsd_lb << std::setw(11) << p.rmsd_ub;
    log << row.str() << "\n";
  }
}

//progress and engine output go to the console as they arrive
class ConsoleObserver : public JobObserver {
    tee& log;
  public:
    explicit ConsoleObserver(tee& l)
        : log(l) {
    }
    void progress(const std::string& jobid, unsigned percent, JobState state) {
      log << "Progress: " << percent << "% (" << jobStateName(state) << ")\n";
      log.flush();
    }
    void partialOutput(const std::string& jobid, const std::string& text) {
      log << text;
      log.flush();
    }
    void settled(const std::string& jobid, const JobOutcome& outcome) {
    }
};

int main(int argc, char* argv[]) {
  using namespace boost::program_options;
  const std::string version_string = std::string("dockrun ") + DOCKRUN_VERSION
      + "   Built " __DATE__ ".";
  const std::string error_message = "\n\nPlease report this error along with the EXACT error "
      "message,\nall command line options and the input files.\n";

  try {
    std::string receptor_name, ligand_name, out_name, log_name, job_log_name, config_name;
    std::string autobox_ligand, autobox_residues;
    std::string engine_name = "vina";
    std::string scratch_dir;
    fl center_x = 0, center_y = 0, center_z = 0, size_x = 0, size_y = 0, size_z = 0;
    fl autobox_add = 0;
    fl timeout = 60;
    autobox_mode autobox = AutoboxNone;
    search_params search;
    int seed = 0;
    bool prepare = false;
    bool quiet = false;
    bool help = false, version = false;

    positional_options_description positional; // remains empty

    options_description inputs("Input");
    inputs.add_options()
    ("receptor,r", value<std::string>(&receptor_name), "receptor (PDBQT, or PDB with --prepare_receptor)")
    ("ligand,l", value<std::string>(&ligand_name),
        "ligand; formats other than PDBQT are converted with OpenBabel");

    options_description search_area("Search space (required)");
    search_area.add_options()
    ("center_x", value<fl>(&center_x), "X coordinate of the center")
    ("center_y", value<fl>(&center_y), "Y coordinate of the center")
    ("center_z", value<fl>(&center_z), "Z coordinate of the center")
    ("size_x", value<fl>(&size_x), "size in the X dimension (Angstroms)")
    ("size_y", value<fl>(&size_y), "size in the Y dimension (Angstroms)")
    ("size_z", value<fl>(&size_z), "size in the Z dimension (Angstroms)")
    ("autobox", value<autobox_mode>(&autobox),
        "compute the box instead: blind, pocket, site, residues or ligand")
    ("autobox_residues", value<std::string>(&autobox_residues),
        "residues to box, e.g. \"ASP25,HIS57\" (implies --autobox residues)")
    ("autobox_ligand", value<std::string>(&autobox_ligand),
        "ligand to use for autobox (implies --autobox ligand)")
    ("autobox_add", value<fl>(&autobox_add),
        "amount of buffer space to add to auto-generated box (default 10 for blind, 5 otherwise)");

    options_description outputs("Output");
    outputs.add_options()
    ("out,o", value<std::string>(&out_name), "output poses (PDBQT), default is <ligand>_out.pdbqt")
    ("log", value<std::string>(&log_name), "optionally, write log file")
    ("job_log", value<std::string>(&job_log_name), "optionally, append timestamped job events");

    options_description searchopts("Search");
    searchopts.add_options()
    ("exhaustiveness", value<int>(&search.exhaustiveness)->default_value(8),
        "exhaustiveness of the global search (roughly proportional to time)")
    ("num_modes", value<int>(&search.num_modes)->default_value(9),
        "maximum number of binding modes to generate")
    ("energy_range", value<fl>(&search.energy_range)->default_value(3),
        "maximum energy difference between the best and worst mode (kcal/mol)")
    ("seed", value<int>(&seed), "explicit random seed");

    options_description engine("Engine");
    engine.add_options()
    ("engine", value<std::string>(&engine_name)->default_value("vina"),
        "docking engine executable (path or name on PATH)")
    ("timeout", value<fl>(&timeout)->default_value(60), "seconds before the run is abandoned")
    ("scratch", value<std::string>(&scratch_dir),
        "directory for per-job working files (default system temp)")
    ("prepare_receptor", bool_switch(&prepare),
        "strip non-protein atoms and convert the receptor to PDBQT");

    options_description misc("Misc (optional)");
    misc.add_options()
    ("quiet,q", bool_switch(&quiet), "Suppress output messages");

    options_description config("Configuration file (optional)");
    config.add_options()("config", value<std::string>(&config_name),
        "the above options can be put here");
    options_description info("Information (optional)");
    info.add_options()
    ("help", bool_switch(&help), "display usage summary")
    ("version", bool_switch(&version), "display program version");

    options_description desc;
    desc.add(inputs).add(search_area).add(outputs).add(searchopts).add(engine).add(misc).add(
        config).add(info);

    variables_map vm;
    try {
      store(
          command_line_parser(argc, argv).options(desc).style(
              command_line_style::default_style ^ command_line_style::allow_guessing)
              .positional(positional).run(), vm);
      notify(vm);
    } catch (boost::program_options::error& e) {
      std::cerr << "Command line parse error: " << e.what() << '\n' << "\nCorrect usage:\n"
          << desc << '\n';
      return 1;
    }
    if (vm.count("config")) {
      try {
        ifile config_stream(config_name);
        store(parse_config_file(config_stream, desc), vm);
        notify(vm);
      } catch (boost::program_options::error& e) {
        std::cerr << "Configuration file parse error: " << e.what() << '\n'
            << "\nCorrect usage:\n" << desc << '\n';
        return 1;
      }
    }
    if (help) {
      std::cout << desc << '\n';
      return 0;
    }
    if (version) {
      std::cout << version_string << '\n';
      return 0;
    }

    tee log(quiet);
    if (vm.count("log") > 0) log.init(log_name);

    if (vm.count("receptor") <= 0) {
      std::cerr << "Missing receptor.\n" << "\nCorrect usage:\n" << desc << '\n';
      return 1;
    }
    if (vm.count("ligand") <= 0) {
      std::cerr << "Missing ligand.\n" << "\nCorrect usage:\n" << desc << '\n';
      return 1;
    }

    if (vm.count("seed")) search.seed = seed;
    check_search_params(search);
    if (!(timeout > 0)) throw usage_error("timeout must be positive");

    log << version_string << '\n';
    log << "Commandline:";
    for (int i = 0; i < argc; i++) {
      log << " " << argv[i];
    }
    log << "\n";

    const std::string receptor_text = read_file(receptor_name);
    std::string receptor = receptor_text;
    if (prepare) {
      receptor = prepare_receptor(receptor);
    } else if (!is_valid_pdbqt(receptor)) {
      throw usage_error(
          "Receptor " + receptor_name + " is not PDBQT; rerun with --prepare_receptor");
    }
    std::string ligand = load_ligand(ligand_name);

    if (autobox == AutoboxNone) {
      if (autobox_ligand.size() > 0)
        autobox = AutoboxLigand;
      else if (autobox_residues.size() > 0) autobox = AutoboxResidues;
    }

    grid_box box;
    pdbqt_atoms receptor_atoms = parse_atoms(receptor);
    switch (autobox) {
    case AutoboxNone: {
      const char* required[] = { "center_x", "center_y", "center_z", "size_x", "size_y", "size_z" };
      for (unsigned i = 0; i < 6; i++) {
        if (vm.count(required[i]) == 0)
          throw usage_error(std::string("Missing search space option --") + required[i]
              + " (or use --autobox)");
      }
      box = grid_box(vec(center_x, center_y, center_z), vec(size_x, size_y, size_z));
      if (!box.valid()) throw usage_error("Search space dimensions should be positive");
      break;
    }
    case AutoboxBlind:
      box = blind_box(receptor_atoms,
          vm.count("autobox_add") ? autobox_add : default_blind_padding);
      print_box(log, "Blind docking box", box);
      break;
    case AutoboxPocket: {
      boost::optional<pocket_site> site = detect_pocket(receptor_atoms);
      if (!site)
        throw usage_error("Too few receptor atoms to detect a pocket");
      box = site->box;
      log << "Pocket: " << site->label << " (confidence " << round2(site->confidence) << ")\n";
      print_box(log, "Pocket box", box);
      break;
    }
    case AutoboxSite: {
      //SITE records and ligands are gone once the receptor is prepared
      known_sites sites = find_known_sites(receptor_text);
      if (sites.empty())
        throw usage_error("No SITE records or bound ligands in " + receptor_name);
      for (sz i = 0; i < sites.size(); i++)
        log << "Known site: " << sites[i].label << ", " << sites[i].description << '\n';
      box = sites[0].box;
      print_box(log, sites[0].label + " box", box);
      break;
    }
    case AutoboxResidues: {
      residue_box_result res = residue_centered_box(receptor_atoms, autobox_residues,
          vm.count("autobox_add") ? autobox_add : default_ligand_padding);
      if (res.match_count == 0) throw usage_error(res.error);
      box = res.box;
      log << "Matched " << res.match_count << " receptor atoms\n";
      print_box(log, "Residue box", box);
      break;
    }
    case AutoboxLigand: {
      if (autobox_ligand.empty())
        throw usage_error("--autobox ligand requires --autobox_ligand");
      pdbqt_atoms ref = parse_atoms(load_ligand(autobox_ligand));
      if (ref.empty()) throw usage_error("Unable to read " + autobox_ligand);
      box = ligand_box(ref, vm.count("autobox_add") ? autobox_add : default_ligand_padding);
      print_box(log, "Ligand box", box);
      break;
    }
    }

    if (out_name.length() == 0) {
      boost::filesystem::path lp(ligand_name);
      std::string stem = lp.stem().string();
      if (lp.extension() == ".gz")
        stem = boost::filesystem::path(stem).stem().string();
      out_name = (lp.parent_path() / (stem + "_out.pdbqt")).string();
    }

    DockingJob job;
    job.id = boost::filesystem::path(ligand_name).stem().string();
    job.receptor = receptor;
    job.ligand = ligand;
    job.box = box;
    job.search = search;
    job.timeoutMs = static_cast<unsigned>(timeout * 1000);

    EngineConfig engine_config;
    engine_config.executable = engine_name;
    engine_config.scratchRoot = scratch_dir;

    Logger job_log(job_log_name);
    ConsoleObserver observer(log);
    JobController controller(engine_config, job_log);
    controller.submit(job, &observer);
    //the controller enforces the timeout itself, this only guards against a hang
    if (!controller.wait(job.timeoutMs + 10000)) controller.abort();

    boost::optional<JobOutcome> outcome = controller.lastOutcome();
    if (!outcome || !outcome->succeeded()) {
      std::cerr << "\n\nDocking failed";
      if (outcome)
        std::cerr << " (" << jobErrorName(outcome->error) << "): " << outcome->message;
      std::cerr << "\n";
      return 1;
    }

    const docking_result& result = outcome->result;
    write_file(out_name, result.raw_structure);
    log << "\n";
    print_results(log, result);
    std::vector<int> mismatched = cross_check_affinities(result);
    if (!mismatched.empty())
      log << "WARNING: " << mismatched.size()
          << " pose(s) carry an affinity that differs from the result table\n";
    log << "Wrote " << result.poses.size() << " poses to " << out_name << "\n";
    log.flush();
  } catch (file_error& e) {
    std::cerr << "\n\nError: could not open \"" << e.name.string() << "\" for "
        << (e.in ? "reading" : "writing") << ".\n";
    return 1;
  } catch (boost::filesystem::filesystem_error& e) {
    std::cerr << "\n\nFile system error: " << e.what() << '\n';
    return 1;
  } catch (usage_error& e) {
    std::cerr << "\n\nUsage error: " << e.what() << "\n";
    return 1;
  } catch (std::bad_alloc&) {
    std::cerr << "\n\nError: insufficient memory!\n";
    return 1;
  }

// Errors that shouldn't happen:

  catch (std::exception& e) {
    std::cerr << "\n\nAn error occurred: " << e.what() << ". " << error_message;
    return 1;
  } catch (internal_error& e) {
    std::cerr << "\n\nAn internal error occurred in " << e.file << "(" << e.line << "). "
        << error_message;
    return 1;
  }
  return 0;
}
