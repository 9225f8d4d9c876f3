#pragma once

// Reference conversions, used by the tests and benchmarks to check floatconv.

char* double_conversion_Fixed(char* buf, int buflen, double value, int decimals);

char* double_conversion_Exponential(char* buf, int buflen, double value, int decimals);

double double_conversion_Strtod(const char* buf, int len, int& processed_characters_count);
