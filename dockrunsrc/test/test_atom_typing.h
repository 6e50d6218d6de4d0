#ifndef TEST_ATOM_TYPING_H
#define TEST_ATOM_TYPING_H

void test_residue_types();
void test_backbone_types();
void test_name_inference();

#endif
