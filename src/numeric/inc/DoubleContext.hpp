#pragma once
#include "NumericContext.hpp"

// Host precision context
class DoubleContext : public NumericContext<double> {
public:
    std::string name() const override { return "double"; }
    int digits10() const override;

    double from_double(double value) const override { return value; }
    double parse(const std::string& text) const override;
    std::string to_string(const double& value) const override;

    double floor(const double& x) const override;
    double frac(const double& x) const override;
    double abs(const double& x) const override;
    double exp(const double& x) const override;
    double divide(const double& num, const double& den) const override;

    static const DoubleContext& instance();
};
