/*
 * collaborators.h
 *
 *  Services that sit outside the docking pipeline.  Front ends supply
 *  implementations; only format_converter has one here
 *  (ob_format_converter).
 */

#ifndef DOCKRUN_COLLABORATORS_H
#define DOCKRUN_COLLABORATORS_H

#include <map>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "box.h"
#include "user_opts.h"
#include "vina_output.h"

//a structure database entry
struct fetched_structure {
    std::string text; //PDB or PDBQT records
    std::string title;
};

//fetch a macromolecule by accession code, e.g. 1HSG
class structure_source {
  public:
    virtual ~structure_source() {
    }
    virtual fetched_structure fetch(const std::string& accession) = 0;
};

struct compound {
    std::string id;
    std::string name;
    std::string structure; //small molecule blob
    std::string format; //format of structure, e.g. sdf
    std::map<std::string, std::string> descriptors; //computed properties, may be empty
};

//small molecule search and retrieval
class compound_source {
  public:
    virtual ~compound_source() {
    }
    virtual std::vector<compound> search(const std::string& query, unsigned max_hits) = 0;
    virtual compound fetch(const std::string& id) = 0;
};

//convert an arbitrary small molecule format to PDBQT
class format_converter {
  public:
    virtual ~format_converter() {
    }
    //format is a format name (sdf, mol2) or a file name to take the extension from
    virtual std::string to_pdbqt(const std::string& text, const std::string& format) = 0;
};

//everything needed to rerun or redisplay a job
struct session_record {
    std::string receptor;
    std::string ligand;
    grid_box box;
    search_params search;
    boost::optional<docking_result> result;
};

class session_store {
  public:
    virtual ~session_store() {
    }
    virtual void save(const std::string& name, const session_record& session) = 0;
    //none if nothing was saved under name
    virtual boost::optional<session_record> restore(const std::string& name) = 0;
};

#endif /* DOCKRUN_COLLABORATORS_H */
