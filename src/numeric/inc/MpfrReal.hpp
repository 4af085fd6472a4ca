#pragma once
#include <mpfr.h>
#include <string>

// Owning handle for an mpfr_t.
// Arithmetic rounds to nearest at the larger precision of its operands, an
// integer operand taking the precision of the other side. Assignment adopts
// the precision of the source.
class MpfrReal {
public:
    static constexpr mpfr_prec_t kDefaultPrecision = 53;

    MpfrReal();
    explicit MpfrReal(long value, mpfr_prec_t precision = kDefaultPrecision);
    ~MpfrReal();

    MpfrReal(const MpfrReal& other);
    MpfrReal(MpfrReal&& other) noexcept;
    MpfrReal& operator=(const MpfrReal& other);
    MpfrReal& operator=(MpfrReal&& other) noexcept;

    // Zero at the given precision
    static MpfrReal with_precision(mpfr_prec_t precision);

    mpfr_prec_t precision() const { return mpfr_get_prec(value_); }
    int sign() const { return mpfr_sgn(value_); }

    mpfr_ptr get() { return value_; }
    mpfr_srcptr get() const { return value_; }

private:
    mpfr_t value_;
};

MpfrReal operator-(const MpfrReal& x);
MpfrReal abs(const MpfrReal& x);

MpfrReal operator+(const MpfrReal& a, const MpfrReal& b);
MpfrReal operator-(const MpfrReal& a, const MpfrReal& b);
MpfrReal operator*(const MpfrReal& a, const MpfrReal& b);

MpfrReal operator+(const MpfrReal& a, long b);
MpfrReal operator+(long a, const MpfrReal& b);
MpfrReal operator-(const MpfrReal& a, long b);
MpfrReal operator-(long a, const MpfrReal& b);
MpfrReal operator*(const MpfrReal& a, long b);
MpfrReal operator*(long a, const MpfrReal& b);

int compare(const MpfrReal& a, const MpfrReal& b);
int compare(const MpfrReal& a, long b);

inline bool operator==(const MpfrReal& a, const MpfrReal& b) { return compare(a, b) == 0; }
inline bool operator!=(const MpfrReal& a, const MpfrReal& b) { return compare(a, b) != 0; }
inline bool operator<(const MpfrReal& a, const MpfrReal& b) { return compare(a, b) < 0; }
inline bool operator<=(const MpfrReal& a, const MpfrReal& b) { return compare(a, b) <= 0; }
inline bool operator>(const MpfrReal& a, const MpfrReal& b) { return compare(a, b) > 0; }
inline bool operator>=(const MpfrReal& a, const MpfrReal& b) { return compare(a, b) >= 0; }

inline bool operator==(const MpfrReal& a, long b) { return compare(a, b) == 0; }
inline bool operator!=(const MpfrReal& a, long b) { return compare(a, b) != 0; }
inline bool operator<(const MpfrReal& a, long b) { return compare(a, b) < 0; }
inline bool operator<=(const MpfrReal& a, long b) { return compare(a, b) <= 0; }
inline bool operator>(const MpfrReal& a, long b) { return compare(a, b) > 0; }
inline bool operator>=(const MpfrReal& a, long b) { return compare(a, b) >= 0; }
