#ifndef TEST_PDBQT_H
#define TEST_PDBQT_H

void test_parse_atom_fields();
void test_malformed_lines_skipped();
void test_convert_to_pdbqt();
void test_is_valid_pdbqt();
void test_remove_non_polymer();
void test_prepare_receptor();

#endif
