/*
 * obmolopener.h
 *
 *  Created on: Jan 10, 2013
 *      Author: dkoes
 *
 * This is a wrapper class for cleanly opening possibly gzipped molecular
 * data files.  It will delete and invalidate any streams that are still
 * open when it goes out of scope.
 */

#ifndef DOCKRUN_OBMOLOPENER_H
#define DOCKRUN_OBMOLOPENER_H

#include <openbabel/obconversion.h>
#include <fstream>
#include <vector>

class obmol_opener {
  public:

    obmol_opener() {
    }
    virtual ~obmol_opener();

    void openForInput(OpenBabel::OBConversion& conv, const std::string& name);

    void clear();

  private:

    obmol_opener(const obmol_opener&);
    obmol_opener& operator=(const obmol_opener& rhs); //you don't want to do this
    std::vector<std::ios*> streams;
};

#endif /* DOCKRUN_OBMOLOPENER_H */
