#pragma once
#include "NumericContext.hpp"

// Periodic and sigmoidal signals evaluated at a single time value.
//
// Every function receiving a context evaluates all its primitives through it,
// so the result carries the context's working precision. A zero period raises
// DivisionByZeroError from NumericContext::divide.
class SignalFunctions {
public:
    template <typename Real>
    using Value = typename NumericContext<Real>::value_type;

    // A * (-1)^floor(2t/P)
    template <typename Real>
    static Real square_wave(const NumericContext<Real>& ctx, const Value<Real>& t,
                            const Value<Real>& amplitude, const Value<Real>& period) {
        const Real n = ctx.floor(ctx.divide(Real(2 * t), period));

        // Even when n/2 has no fractional part, negative n included
        const Real half = ctx.divide(n, ctx.from_double(2.0));
        if (ctx.frac(half) == 0) {
            return amplitude;
        }
        return Real(-amplitude);
    }

    // 2A * (1/2 - |1 - 2 frac(t/P + 1/4)|)
    template <typename Real>
    static Real triangle_wave(const NumericContext<Real>& ctx, const Value<Real>& t,
                              const Value<Real>& amplitude, const Value<Real>& period) {
        const Real phase = ctx.frac(Real(ctx.divide(t, period) + ctx.from_double(0.25)));
        const Real distance = ctx.abs(Real(1 - 2 * phase));
        return Real(2 * amplitude * (ctx.from_double(0.5) - distance));
    }

    // A * frac(t/P), zero on every multiple of P
    template <typename Real>
    static Real sawtooth_wave(const NumericContext<Real>& ctx, const Value<Real>& t,
                              const Value<Real>& amplitude, const Value<Real>& period) {
        return Real(amplitude * ctx.frac(ctx.divide(t, period)));
    }

    // A / (1 + exp(-t))
    template <typename Real>
    static Real sigmoid_wave(const NumericContext<Real>& ctx, const Value<Real>& t,
                             const Value<Real>& amplitude) {
        const Real one = ctx.from_double(1.0);
        if (t < 0) {
            // Same value as A*e/(1+e) with e = exp(t) <= 1
            const Real e = ctx.exp(t);
            return ctx.divide(Real(amplitude * e), Real(one + e));
        }
        const Real e = ctx.exp(Real(-t));
        return ctx.divide(amplitude, Real(one + e));
    }

    // A * (1 - |t|) inside (-1, 1), exactly zero elsewhere.
    // Needs only comparison and the value type's own abs.
    template <typename Real>
    static Real unit_triangle_pulse(const Real& t, const Real& amplitude) {
        using std::abs;
        if (t <= -1 || t >= 1) {
            return Real(0);
        }
        return Real(amplitude * (1 - abs(t)));
    }

    // Overloads with the default amplitude and period of 1
    template <typename Real>
    static Real square_wave(const NumericContext<Real>& ctx, const Value<Real>& t) {
        return square_wave(ctx, t, ctx.from_double(1.0), ctx.from_double(1.0));
    }

    template <typename Real>
    static Real square_wave(const NumericContext<Real>& ctx, const Value<Real>& t,
                            const Value<Real>& amplitude) {
        return square_wave(ctx, t, amplitude, ctx.from_double(1.0));
    }

    template <typename Real>
    static Real triangle_wave(const NumericContext<Real>& ctx, const Value<Real>& t) {
        return triangle_wave(ctx, t, ctx.from_double(1.0), ctx.from_double(1.0));
    }

    template <typename Real>
    static Real triangle_wave(const NumericContext<Real>& ctx, const Value<Real>& t,
                              const Value<Real>& amplitude) {
        return triangle_wave(ctx, t, amplitude, ctx.from_double(1.0));
    }

    template <typename Real>
    static Real sawtooth_wave(const NumericContext<Real>& ctx, const Value<Real>& t) {
        return sawtooth_wave(ctx, t, ctx.from_double(1.0), ctx.from_double(1.0));
    }

    template <typename Real>
    static Real sawtooth_wave(const NumericContext<Real>& ctx, const Value<Real>& t,
                              const Value<Real>& amplitude) {
        return sawtooth_wave(ctx, t, amplitude, ctx.from_double(1.0));
    }

    template <typename Real>
    static Real sigmoid_wave(const NumericContext<Real>& ctx, const Value<Real>& t) {
        return sigmoid_wave(ctx, t, ctx.from_double(1.0));
    }

    template <typename Real>
    static Real unit_triangle_pulse(const Real& t) {
        return unit_triangle_pulse(t, Real(1));
    }
};
