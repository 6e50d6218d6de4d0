/*
 * atom_typing.h
 *
 *  AutoDock atom type inference for PDB atoms that arrive without one.
 *
 *  This is a lookup heuristic, not a chemical perception algorithm: standard
 *  amino acids get donor/acceptor aware types from per-residue tables, and
 *  everything else (ligands, modified residues, ions) is typed from the
 *  leading letters of the atom name.  The result is good enough for the
 *  engine to accept the receptor; it is not a replacement for proper
 *  receptor preparation.
 */

#ifndef DOCKRUN_ATOM_TYPING_H
#define DOCKRUN_ATOM_TYPING_H

#include <string>

//the type used when nothing else matches
extern const char* const default_ad_type;

//never throws; unknown names fall back to default_ad_type
std::string assign_atom_type(const std::string& res_name, const std::string& atom_name);

//element guess from an atom name only (tier three of assign_atom_type)
std::string infer_type_from_name(const std::string& atom_name);

#endif /* DOCKRUN_ATOM_TYPING_H */
