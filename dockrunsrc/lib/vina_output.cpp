#include "vina_output.h"

#include <cctype>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

static bool begins_with_digit(const std::string& s) {
  return !s.empty() && std::isdigit(static_cast<unsigned char>(s[0]));
}

//rmsd columns are informational, anything unreadable is 0
static fl rmsd_field(const std::string& s) {
  try {
    return boost::lexical_cast<fl>(s);
  } catch (boost::bad_lexical_cast&) {
    return 0;
  }
}

std::vector<affinity_row> parse_affinity_table(const std::string& log) {
  std::vector<affinity_row> rows;
  std::istringstream in(log);
  std::string line;
  bool in_table = false;

  while (std::getline(in, line)) {
    std::string trimmed = boost::trim_copy(line);
    if (!in_table) {
      if (line.find("mode") != std::string::npos && line.find("affinity") != std::string::npos)
        in_table = true;
      continue;
    }
    if (trimmed.empty()) {
      in_table = false;
      continue;
    }
    if (!begins_with_digit(trimmed)) continue; //units and separator lines

    std::vector<std::string> fields;
    boost::split(fields, trimmed, boost::is_space(), boost::token_compress_on);
    if (fields.size() < 4) continue;

    affinity_row row;
    try {
      row.mode = boost::lexical_cast<int>(fields[0]);
      row.affinity = boost::lexical_cast<fl>(fields[1]);
    } catch (boost::bad_lexical_cast&) {
      continue;
    }
    row.rmsd_lb = rmsd_field(fields[2]);
    row.rmsd_ub = rmsd_field(fields[3]);
    rows.push_back(row);
  }
  return rows;
}

std::vector<std::string> split_poses(const std::string& structure) {
  std::vector<std::string> blocks;
  std::vector<std::string> current;
  bool in_model = false;

  std::istringstream in(structure);
  std::string line;
  while (std::getline(in, line)) {
    if (starts_with(line, "MODEL")) {
      current.clear();
      in_model = true;
      current.push_back(line);
    } else if (starts_with(line, "ENDMDL")) {
      if (in_model) {
        current.push_back(line);
        blocks.push_back(boost::join(current, "\n"));
      }
      current.clear();
      in_model = false;
    } else if (in_model) {
      current.push_back(line);
    }
  }

  if (blocks.empty() && !boost::trim_copy(structure).empty()) {
    blocks.push_back(structure);
  }
  return blocks;
}

docking_result assemble(const std::string& log, const std::string& structure) {
  docking_result result;
  result.raw_log = log;
  result.raw_structure = structure;

  std::vector<affinity_row> rows = parse_affinity_table(log);
  std::vector<std::string> blocks = split_poses(structure);
  sz n = std::min(rows.size(), blocks.size());
  for (sz i = 0; i < n; i++) {
    pose p(rows[i]);
    p.structure = blocks[i];
    result.poses.push_back(p);
  }
  return result;
}

boost::optional<fl> extract_affinity_from_block(const std::string& block) {
  static const boost::regex expr("REMARK VINA RESULT:\\s+([-\\d.]+)");
  boost::smatch what;
  if (!boost::regex_search(block, what, expr)) return boost::none;
  try {
    return boost::lexical_cast<fl>(what[1].str());
  } catch (boost::bad_lexical_cast&) {
    return boost::none;
  }
}

std::vector<int> cross_check_affinities(const docking_result& result, fl tolerance) {
  std::vector<int> mismatched;
  for (sz i = 0; i < result.poses.size(); i++) {
    const pose& p = result.poses[i];
    boost::optional<fl> embedded = extract_affinity_from_block(p.structure);
    if (embedded && std::abs(*embedded - p.affinity) > tolerance) mismatched.push_back(p.mode);
  }
  return mismatched;
}
