#include "MpfrContext.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

constexpr double kLog2Of10 = 3.3219280948873626;

}

MpfrContext::MpfrContext(int digits10) : digits10_(digits10) {
    if (digits10 < kMinDigits || digits10 > kMaxDigits) {
        throw std::invalid_argument("Precision out of range: " + std::to_string(digits10)
            + " (expected " + std::to_string(kMinDigits) + ".." + std::to_string(kMaxDigits) + " digits)");
    }
    bits_ = digits_to_bits(digits10);
}

mpfr_prec_t MpfrContext::digits_to_bits(int digits10) {
    return static_cast<mpfr_prec_t>(std::lround((digits10 + 1) * kLog2Of10));
}

MpfrReal MpfrContext::from_double(double value) const {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Cannot represent non-finite value in mpfr context");
    }
    MpfrReal result = MpfrReal::with_precision(bits_);
    mpfr_set_d(result.get(), value, MPFR_RNDN);
    return result;
}

MpfrReal MpfrContext::parse(const std::string& text) const {
    MpfrReal value = MpfrReal::with_precision(bits_);
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) {
        throw std::invalid_argument("Invalid number: '" + text + "'");
    }

    char* end = nullptr;
    mpfr_strtofr(value.get(), text.c_str(), &end, 10, MPFR_RNDN);
    if (end != text.c_str() + text.size() || !mpfr_number_p(value.get())) {
        throw std::invalid_argument("Invalid number: '" + text + "'");
    }
    return value;
}

std::string MpfrContext::to_string(const MpfrReal& value) const {
    int len = mpfr_snprintf(nullptr, 0, "%.*RNg", digits10_, value.get());
    if (len < 0) {
        throw std::runtime_error("Failed to format mpfr value");
    }

    std::vector<char> buffer(static_cast<size_t>(len) + 1);
    mpfr_snprintf(buffer.data(), buffer.size(), "%.*RNg", digits10_, value.get());
    return std::string(buffer.data(), static_cast<size_t>(len));
}

MpfrReal MpfrContext::floor(const MpfrReal& x) const {
    // Rounding down keeps the result <= x even when the integer needs more bits
    MpfrReal result = MpfrReal::with_precision(bits_);
    mpfr_rint_floor(result.get(), x.get(), MPFR_RNDD);
    return result;
}

MpfrReal MpfrContext::frac(const MpfrReal& x) const {
    MpfrReal result = MpfrReal::with_precision(bits_);
    mpfr_sub(result.get(), x.get(), floor(x).get(), MPFR_RNDN);

    // x just below an integer rounds up to 1; keep the largest value below it
    if (mpfr_cmp_ui(result.get(), 1) >= 0) {
        mpfr_set_ui(result.get(), 1, MPFR_RNDN);
        mpfr_nextbelow(result.get());
    }
    return result;
}

MpfrReal MpfrContext::abs(const MpfrReal& x) const {
    MpfrReal result = MpfrReal::with_precision(bits_);
    mpfr_abs(result.get(), x.get(), MPFR_RNDN);
    return result;
}

MpfrReal MpfrContext::exp(const MpfrReal& x) const {
    MpfrReal result = MpfrReal::with_precision(bits_);
    mpfr_exp(result.get(), x.get(), MPFR_RNDN);
    if (mpfr_inf_p(result.get())) {
        throw NumericOverflowError("exp argument too large: " + to_string(x));
    }
    return result;
}

MpfrReal MpfrContext::divide(const MpfrReal& num, const MpfrReal& den) const {
    if (den.sign() == 0) {
        throw DivisionByZeroError();
    }
    MpfrReal result = MpfrReal::with_precision(bits_);
    mpfr_div(result.get(), num.get(), den.get(), MPFR_RNDN);
    return result;
}
