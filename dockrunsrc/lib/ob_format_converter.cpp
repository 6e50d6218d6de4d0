#include "ob_format_converter.h"
#include "obmolopener.h"
#include <openbabel/mol.h>
#include <openbabel/atom.h>
#include <openbabel/obiter.h>

using namespace OpenBabel;

//hydrogens and charges the engine needs, then PDBQT text
static std::string write_pdbqt(OBConversion& conv, OBMol& mol) {
  if (!conv.SetOutFormat("PDBQT"))
    throw usage_error("OpenBabel was built without PDBQT support");
  mol.AddHydrogens(true);
  //force partial charge calculation
  FOR_ATOMS_OF_MOL(a, mol){
    a->GetPartialCharge();
  }
  return conv.WriteString(&mol);
}

std::string ob_format_converter::to_pdbqt(const std::string& text, const std::string& format) {
  OBConversion conv;
  OBFormat *in = NULL;
  if (format.find('.') != std::string::npos)
    in = conv.FormatFromExt(format);
  else
    in = conv.FindFormat(format);
  if (!in || !conv.SetInFormat(in))
    throw usage_error("Unknown molecular format " + format);

  OBMol mol;
  if (!conv.ReadString(&mol, text) || mol.NumAtoms() == 0)
    throw usage_error("Unable to read " + format + " molecule");
  return write_pdbqt(conv, mol);
}

std::string ob_format_converter::file_to_pdbqt(const std::string& fname) {
  obmol_opener opener;
  OBConversion conv;
  opener.openForInput(conv, fname);

  OBMol mol;
  if (!conv.Read(&mol) || mol.NumAtoms() == 0)
    throw usage_error("Unable to read " + fname);
  return write_pdbqt(conv, mol);
}
