#pragma once
#include "MpfrReal.hpp"
#include "NumericContext.hpp"

// Arbitrary precision context on top of MPFR.
// The precision is fixed at construction and attached to every value this
// context creates; each primitive is correctly rounded to nearest.
class MpfrContext : public NumericContext<MpfrReal> {
public:
    static constexpr int kMinDigits = 1;
    static constexpr int kMaxDigits = 100000;

    explicit MpfrContext(int digits10 = 15);

    std::string name() const override { return "mpfr"; }
    int digits10() const override { return digits10_; }
    mpfr_prec_t precision_bits() const { return bits_; }

    MpfrReal from_double(double value) const override;
    MpfrReal parse(const std::string& text) const override;
    std::string to_string(const MpfrReal& value) const override;

    MpfrReal floor(const MpfrReal& x) const override;
    MpfrReal frac(const MpfrReal& x) const override;
    MpfrReal abs(const MpfrReal& x) const override;

    // Raises NumericOverflowError past MPFR's exponent range; underflow gives 0
    MpfrReal exp(const MpfrReal& x) const override;

    MpfrReal divide(const MpfrReal& num, const MpfrReal& den) const override;

    static mpfr_prec_t digits_to_bits(int digits10);

private:
    int digits10_;
    mpfr_prec_t bits_;
};
