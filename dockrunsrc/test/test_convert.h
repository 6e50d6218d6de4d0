#ifndef TEST_CONVERT_H
#define TEST_CONVERT_H

void test_convert_xyz();
void test_convert_errors();

#endif
