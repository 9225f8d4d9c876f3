#include "double-conversion.h"

#include <double-conversion/double-conversion.h>

char* double_conversion_Fixed(char* buf, int buflen, double value, int decimals)
{
    auto& converter = double_conversion::DoubleToStringConverter::EcmaScriptConverter();
    double_conversion::StringBuilder builder(buf, buflen);
    if (!converter.ToFixed(value, decimals, &builder))
        return buf;
    return buf + builder.position();
}

char* double_conversion_Exponential(char* buf, int buflen, double value, int decimals)
{
    auto& converter = double_conversion::DoubleToStringConverter::EcmaScriptConverter();
    double_conversion::StringBuilder builder(buf, buflen);
    if (!converter.ToExponential(value, decimals, &builder))
        return buf;
    return buf + builder.position();
}

double double_conversion_Strtod(const char* buf, int len, int& processed_characters_count)
{
    double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
    processed_characters_count = 0;
    return s2d.StringToDouble(buf, len, &processed_characters_count);
}
