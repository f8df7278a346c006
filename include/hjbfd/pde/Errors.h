#ifndef HJBFD_ERRORS_H
#define HJBFD_ERRORS_H

#include <stdexcept>

/// Linear system (rho*I - L) cannot be inverted
class SingularSystemError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Time integration failed to step or converge
class IntegrationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif // HJBFD_ERRORS_H
