#include <charconv>
#include <cmath>
#include <limits>
#include "model/number.hpp"

namespace sylva
{
    std::string formatInteger(std::int64_t value)
    {
        return std::to_string(value);
    }

    std::string formatFloat(double value)
    {
        if (!std::isfinite(value))
        {
            return std::isnan(value) ? "nan" : (value < 0 ? "-inf" : "inf");
        }

        // Shortest round-trip digits in fixed notation. DBL_MAX needs 309
        // integral digits, the smallest denormal 324 fractional ones.
        char buffer[400];
        auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
        std::string text(buffer, result.ptr);
        if (text.find('.') == std::string::npos)
        {
            text += ".0";
        }
        return text;
    }

    std::string Number::format() const
    {
        return isInteger() ? formatInteger(integer_) : formatFloat(float_);
    }

    Number Number::operator-() const
    {
        if (isInteger())
        {
            // -INT64_MIN does not fit, it continues as a double.
            if (integer_ == std::numeric_limits<std::int64_t>::min())
            {
                return Number(-static_cast<double>(integer_));
            }
            return Number(-integer_);
        }
        return Number(-float_);
    }

    bool operator==(const Number &lhs, const Number &rhs)
    {
        if (lhs.kind_ != rhs.kind_)
        {
            return false;
        }
        return lhs.isInteger() ? lhs.integer_ == rhs.integer_ : lhs.float_ == rhs.float_;
    }
} // namespace sylva
