#pragma once
#include "NumericError.hpp"
#include <string>

// Arithmetic capability the signal functions are written against.
// A context is immutable once built; every primitive returns a value
// at the context's working precision.
template <typename Real>
class NumericContext {
public:
    using value_type = Real;

    virtual ~NumericContext() = default;

    virtual std::string name() const = 0;
    virtual int digits10() const = 0;

    // Conversions at working precision
    virtual Real from_double(double value) const = 0;
    virtual Real parse(const std::string& text) const = 0;
    virtual std::string to_string(const Real& value) const = 0;

    // Primitives
    virtual Real floor(const Real& x) const = 0;

    // x - floor(x), kept strictly below 1 when the subtraction rounds up to it
    virtual Real frac(const Real& x) const = 0;

    virtual Real abs(const Real& x) const = 0;
    virtual Real exp(const Real& x) const = 0;

    // Throws DivisionByZeroError when den is zero
    virtual Real divide(const Real& num, const Real& den) const = 0;
};
