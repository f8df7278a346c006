#ifndef HJBFD_BOUNDARYCONDITIONS_H
#define HJBFD_BOUNDARYCONDITIONS_H

#include <memory>

/**
 * Boundary variants closing the finite difference stencil at x_min and x_max.
 *
 * Each side is closed with a ghost node outside the domain:
 *   u_ghost = w * u_boundary
 *
 *   - Reflecting (zero flux, Neumann):   w = 1
 *   - Absorbing  (homogeneous Dirichlet): w = 0
 */
enum class BoundaryType { Reflecting, Absorbing };

/**
 * Ghost coefficient w of a boundary variant
 * @throws std::invalid_argument for a value outside BoundaryType
 */
double ghostCoefficient(BoundaryType type);

/**
 * @class BoundaryCondition
 * @brief Abstract base class for one side of the domain
 */
class BoundaryCondition
{
public:
    virtual ~BoundaryCondition() = default;

    virtual BoundaryType type() const = 0;                   // PVM
    virtual std::unique_ptr<BoundaryCondition> clone() const = 0; // PVM

    double ghostCoefficient() const { return ::ghostCoefficient(type()); }
};

/**
 * @class ReflectingBC
 * @brief No-flux boundary: the boundary node mirrors into the ghost node
 */
class ReflectingBC : public BoundaryCondition
{
public:
    BoundaryType type() const override { return BoundaryType::Reflecting; }
    std::unique_ptr<BoundaryCondition> clone() const override;
};

/**
 * @class AbsorbingBC
 * @brief u = 0 just outside the domain
 */
class AbsorbingBC : public BoundaryCondition
{
public:
    BoundaryType type() const override { return BoundaryType::Absorbing; }
    std::unique_ptr<BoundaryCondition> clone() const override;
};

/**
 * Factory from tag
 * @throws std::invalid_argument for a value outside BoundaryType
 */
std::unique_ptr<BoundaryCondition> makeBoundaryCondition(BoundaryType type);

/**
 * @class BoundaryConditions
 * @brief (lower, upper) pair of boundary conditions, deep-copied on copy
 */
class BoundaryConditions
{
public:
    BoundaryConditions(const BoundaryCondition& lower, const BoundaryCondition& upper);
    BoundaryConditions(BoundaryType lower, BoundaryType upper);

    BoundaryConditions(const BoundaryConditions& other);
    BoundaryConditions& operator=(const BoundaryConditions& other);
    BoundaryConditions(BoundaryConditions&&) noexcept = default;
    BoundaryConditions& operator=(BoundaryConditions&&) noexcept = default;
    ~BoundaryConditions() = default;

    // reflecting on both sides
    static BoundaryConditions reflecting();

    const BoundaryCondition& lower() const { return *_lower; }
    const BoundaryCondition& upper() const { return *_upper; }

private:
    std::unique_ptr<BoundaryCondition> _lower;
    std::unique_ptr<BoundaryCondition> _upper;
};

#endif // HJBFD_BOUNDARYCONDITIONS_H
