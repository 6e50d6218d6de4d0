#ifndef TEST_VINA_OUTPUT_H
#define TEST_VINA_OUTPUT_H

void test_affinity_table();
void test_split_poses();
void test_assemble();
void test_cross_check();

#endif
