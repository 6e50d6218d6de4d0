/*
 * ob_format_converter.h
 *
 *  format_converter backed by OpenBabel.  Hydrogens are added (polar only)
 *  and Gasteiger partial charges are computed before writing PDBQT.
 */

#ifndef DOCKRUN_OB_FORMAT_CONVERTER_H
#define DOCKRUN_OB_FORMAT_CONVERTER_H

#include "collaborators.h"

class ob_format_converter : public format_converter {
  public:
    //throws usage_error if the format is unknown or nothing could be read
    std::string to_pdbqt(const std::string& text, const std::string& format);

    //first molecule of a (possibly gzipped) file; throws file_error or usage_error
    std::string file_to_pdbqt(const std::string& fname);
};

#endif /* DOCKRUN_OB_FORMAT_CONVERTER_H */
