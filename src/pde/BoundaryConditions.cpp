#include <hjbfd/pde/BoundaryConditions.h>
#include <stdexcept>
#include <string>

double ghostCoefficient(BoundaryType type)
{
    switch (type) {
        case BoundaryType::Reflecting:
            return 1.0;
        case BoundaryType::Absorbing:
            return 0.0;
    }
    throw std::invalid_argument("ghostCoefficient: Unrecognized boundary type "
                                + std::to_string(static_cast<int>(type)));
}

// ============================================================================
// Concrete conditions
// ============================================================================

std::unique_ptr<BoundaryCondition> ReflectingBC::clone() const
{
    return std::make_unique<ReflectingBC>(*this);
}

std::unique_ptr<BoundaryCondition> AbsorbingBC::clone() const
{
    return std::make_unique<AbsorbingBC>(*this);
}

std::unique_ptr<BoundaryCondition> makeBoundaryCondition(BoundaryType type)
{
    switch (type) {
        case BoundaryType::Reflecting:
            return std::make_unique<ReflectingBC>();
        case BoundaryType::Absorbing:
            return std::make_unique<AbsorbingBC>();
    }
    throw std::invalid_argument("makeBoundaryCondition: Unrecognized boundary type "
                                + std::to_string(static_cast<int>(type)));
}

// ============================================================================
// BoundaryConditions pair
// ============================================================================

BoundaryConditions::BoundaryConditions(const BoundaryCondition& lower, const BoundaryCondition& upper)
    : _lower(lower.clone()), _upper(upper.clone())
{
}

BoundaryConditions::BoundaryConditions(BoundaryType lower, BoundaryType upper)
    : _lower(makeBoundaryCondition(lower)), _upper(makeBoundaryCondition(upper))
{
}

BoundaryConditions::BoundaryConditions(const BoundaryConditions& other)
    : _lower(other._lower->clone()), _upper(other._upper->clone())
{
}

BoundaryConditions& BoundaryConditions::operator=(const BoundaryConditions& other)
{
    if (this != &other) {
        _lower = other._lower->clone();
        _upper = other._upper->clone();
    }
    return *this;
}

BoundaryConditions BoundaryConditions::reflecting()
{
    return BoundaryConditions(BoundaryType::Reflecting, BoundaryType::Reflecting);
}
