#include <hjbfd/pde/Payoff.h>
#include <cmath>
#include <stdexcept>
#include <utility>

std::vector<double> Payoff::evaluate(const Grid& grid, double t) const
{
    std::vector<double> r(grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        r[i] = value(grid.point(i), t);
    }
    return r;
}

// ============================================================================
// ConstantPayoff
// ============================================================================

ConstantPayoff::ConstantPayoff(double c)
    : _c(c)
{
}

double ConstantPayoff::value(double, double) const
{
    return _c;
}

std::unique_ptr<Payoff> ConstantPayoff::clone() const
{
    return std::make_unique<ConstantPayoff>(*this);
}

// ============================================================================
// DecayingLinearPayoff
// ============================================================================

DecayingLinearPayoff::DecayingLinearPayoff(double decayRate)
    : _a(decayRate)
{
}

double DecayingLinearPayoff::value(double x, double t) const
{
    return x * std::exp(-_a * t);
}

std::unique_ptr<Payoff> DecayingLinearPayoff::clone() const
{
    return std::make_unique<DecayingLinearPayoff>(*this);
}

// ============================================================================
// FunctionPayoff
// ============================================================================

FunctionPayoff::FunctionPayoff(std::function<double(double, double)> fn)
    : _fn(std::move(fn))
{
    if (!_fn) {
        throw std::invalid_argument("FunctionPayoff: Payoff function cannot be null");
    }
}

double FunctionPayoff::value(double x, double t) const
{
    return _fn(x, t);
}

std::unique_ptr<Payoff> FunctionPayoff::clone() const
{
    return std::make_unique<FunctionPayoff>(*this);
}
