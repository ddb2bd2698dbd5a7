#ifndef SYLVA_MODEL_NUMBER_HPP
#define SYLVA_MODEL_NUMBER_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace sylva
{
    // Result of evaluating an expression. Remembers whether it is integral.
    // Integer arithmetic that would overflow int64 continues as a double.
    class Number
    {
    public:
        enum class Kind
        {
            Integer,
            Float
        };

        Number(std::int64_t value) : kind_(Kind::Integer), integer_(value), float_(0.0) {}
        Number(int value) : Number(static_cast<std::int64_t>(value)) {}
        Number(double value) : kind_(Kind::Float), integer_(0), float_(value) {}

        bool isInteger() const { return kind_ == Kind::Integer; }
        bool isFloat() const { return kind_ == Kind::Float; }

        std::int64_t getInteger() const { return integer_; }
        double getFloat() const { return float_; }
        double toDouble() const { return isInteger() ? static_cast<double>(integer_) : float_; }

        bool isZero() const { return isInteger() ? integer_ == 0 : float_ == 0.0; }

        // Same text an Integer or Float literal renders to. Floats are written
        // in fixed notation with at least one digit after the point.
        std::string format() const;

        Number operator-() const;

        friend bool operator==(const Number &lhs, const Number &rhs);
        friend bool operator!=(const Number &lhs, const Number &rhs) { return !(lhs == rhs); }
        friend std::ostream &operator<<(std::ostream &os, const Number &number) { return os << number.format(); }

    private:
        Kind kind_;
        std::int64_t integer_;
        double float_;
    };

    std::string formatInteger(std::int64_t value);
    std::string formatFloat(double value);
} // namespace sylva

#endif // SYLVA_MODEL_NUMBER_HPP
