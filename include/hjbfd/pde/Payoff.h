#ifndef HJBFD_PAYOFF_H
#define HJBFD_PAYOFF_H

#include <hjbfd/pde/Grid.h>
#include <functional>
#include <memory>
#include <vector>

/**
 * @class Payoff
 * @brief Flow payoff r(x,t) of the HJB equation
 *
 *   rho*v = r(x,t) + mu*∂v/∂x + (sigma²/2)*∂²v/∂x² + ∂v/∂t
 *
 * Must be a pure function of (x,t).
 */
class Payoff
{
public:
    virtual ~Payoff() = default;

    virtual double value(double x, double t) const = 0;
    virtual std::unique_ptr<Payoff> clone() const = 0;

    double operator()(double x, double t) const { return value(x, t); }

    // r(x_i, t) for every grid point
    std::vector<double> evaluate(const Grid& grid, double t) const;
};

/**
 * @class ConstantPayoff
 * @brief r(x,t) = c
 */
class ConstantPayoff : public Payoff
{
public:
    explicit ConstantPayoff(double c);

    double value(double x, double t) const override;
    std::unique_ptr<Payoff> clone() const override;

private:
    double _c;
};

/**
 * @class DecayingLinearPayoff
 * @brief r(x,t) = x * exp(-a*t)
 */
class DecayingLinearPayoff : public Payoff
{
public:
    explicit DecayingLinearPayoff(double decayRate = 1.0);

    double value(double x, double t) const override;
    std::unique_ptr<Payoff> clone() const override;

private:
    double _a;
};

/**
 * @class FunctionPayoff
 * @brief Wraps an arbitrary callable r(x,t)
 */
class FunctionPayoff : public Payoff
{
public:
    explicit FunctionPayoff(std::function<double(double, double)> fn);

    double value(double x, double t) const override;
    std::unique_ptr<Payoff> clone() const override;

private:
    std::function<double(double, double)> _fn;
};

#endif // HJBFD_PAYOFF_H
