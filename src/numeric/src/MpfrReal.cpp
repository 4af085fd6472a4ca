#include "MpfrReal.hpp"
#include <algorithm>

namespace {

mpfr_prec_t wider(const MpfrReal& a, const MpfrReal& b) {
    return std::max(a.precision(), b.precision());
}

}

MpfrReal::MpfrReal() : MpfrReal(0L) {}

MpfrReal::MpfrReal(long value, mpfr_prec_t precision) {
    mpfr_init2(value_, precision);
    mpfr_set_si(value_, value, MPFR_RNDN);
}

MpfrReal::~MpfrReal() {
    mpfr_clear(value_);
}

MpfrReal::MpfrReal(const MpfrReal& other) {
    mpfr_init2(value_, other.precision());
    mpfr_set(value_, other.value_, MPFR_RNDN);
}

MpfrReal::MpfrReal(MpfrReal&& other) noexcept {
    mpfr_init2(value_, MPFR_PREC_MIN);
    mpfr_swap(value_, other.value_);
}

MpfrReal& MpfrReal::operator=(const MpfrReal& other) {
    if (this != &other) {
        mpfr_set_prec(value_, other.precision());
        mpfr_set(value_, other.value_, MPFR_RNDN);
    }
    return *this;
}

MpfrReal& MpfrReal::operator=(MpfrReal&& other) noexcept {
    mpfr_swap(value_, other.value_);
    return *this;
}

MpfrReal MpfrReal::with_precision(mpfr_prec_t precision) {
    return MpfrReal(0L, precision);
}

MpfrReal operator-(const MpfrReal& x) {
    MpfrReal result = MpfrReal::with_precision(x.precision());
    mpfr_neg(result.get(), x.get(), MPFR_RNDN);
    return result;
}

MpfrReal abs(const MpfrReal& x) {
    MpfrReal result = MpfrReal::with_precision(x.precision());
    mpfr_abs(result.get(), x.get(), MPFR_RNDN);
    return result;
}

MpfrReal operator+(const MpfrReal& a, const MpfrReal& b) {
    MpfrReal result = MpfrReal::with_precision(wider(a, b));
    mpfr_add(result.get(), a.get(), b.get(), MPFR_RNDN);
    return result;
}

MpfrReal operator-(const MpfrReal& a, const MpfrReal& b) {
    MpfrReal result = MpfrReal::with_precision(wider(a, b));
    mpfr_sub(result.get(), a.get(), b.get(), MPFR_RNDN);
    return result;
}

MpfrReal operator*(const MpfrReal& a, const MpfrReal& b) {
    MpfrReal result = MpfrReal::with_precision(wider(a, b));
    mpfr_mul(result.get(), a.get(), b.get(), MPFR_RNDN);
    return result;
}

MpfrReal operator+(const MpfrReal& a, long b) {
    MpfrReal result = MpfrReal::with_precision(a.precision());
    mpfr_add_si(result.get(), a.get(), b, MPFR_RNDN);
    return result;
}

MpfrReal operator+(long a, const MpfrReal& b) {
    return b + a;
}

MpfrReal operator-(const MpfrReal& a, long b) {
    MpfrReal result = MpfrReal::with_precision(a.precision());
    mpfr_sub_si(result.get(), a.get(), b, MPFR_RNDN);
    return result;
}

MpfrReal operator-(long a, const MpfrReal& b) {
    MpfrReal result = MpfrReal::with_precision(b.precision());
    mpfr_si_sub(result.get(), a, b.get(), MPFR_RNDN);
    return result;
}

MpfrReal operator*(const MpfrReal& a, long b) {
    MpfrReal result = MpfrReal::with_precision(a.precision());
    mpfr_mul_si(result.get(), a.get(), b, MPFR_RNDN);
    return result;
}

MpfrReal operator*(long a, const MpfrReal& b) {
    return b * a;
}

int compare(const MpfrReal& a, const MpfrReal& b) {
    return mpfr_cmp(a.get(), b.get());
}

int compare(const MpfrReal& a, long b) {
    return mpfr_cmp_si(a.get(), b);
}
