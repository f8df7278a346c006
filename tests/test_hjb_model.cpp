#include <gtest/gtest.h>
#include <hjbfd/pde/HJBModel.h>
#include <hjbfd/pde/Errors.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

// ============================================================================
// Test Fixtures
// ============================================================================

class HJBModelTest : public ::testing::Test {
protected:
    Grid grid{0.0, 1.0, 20};
    double mu = -0.1;
    double sigma = 0.1;
    double rho = 0.05;
};

// ============================================================================
// Parameter validation
// ============================================================================

TEST_F(HJBModelTest, ParametersStoreValues) {
    ModelParameters params(mu, sigma, rho, grid);

    EXPECT_EQ(params.mu(), mu);
    EXPECT_EQ(params.sigma(), sigma);
    EXPECT_EQ(params.rho(), rho);
    EXPECT_EQ(params.grid().size(), 20u);
    EXPECT_EQ(params.boundaryConditions().lower().type(), BoundaryType::Reflecting);
    EXPECT_EQ(params.boundaryConditions().upper().type(), BoundaryType::Reflecting);
    EXPECT_EQ(params.upwind(), UpwindDirection::Backward);
}

TEST_F(HJBModelTest, ParametersRejectInvalidValues) {
    EXPECT_THROW(ModelParameters(mu, -0.1, rho, grid), std::invalid_argument)
        << "Should reject negative sigma";
    EXPECT_THROW(ModelParameters(NAN, sigma, rho, grid), std::invalid_argument);
    EXPECT_THROW(ModelParameters(mu, sigma, INFINITY, grid), std::invalid_argument);
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(HJBModelTest, SystemMatrixIsRhoMinusGenerator) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, ConstantPayoff(1.0));

    const Matrix& L = model.generator();
    const Matrix& A = model.systemMatrix();
    ASSERT_EQ(A.size(), grid.size());

    for (size_t i = 0; i < grid.size(); ++i) {
        for (size_t j = 0; j < grid.size(); ++j) {
            double expected = (i == j ? rho : 0.0) - L[i][j];
            EXPECT_NEAR(A[i][j], expected, 1e-12);

            double Lij = mu * model.firstDerivative()[i][j]
                       + 0.5 * sigma * sigma * model.secondDerivative()[i][j];
            EXPECT_NEAR(L[i][j], Lij, 1e-12);
        }
    }
}

TEST_F(HJBModelTest, PayoffIsCloned) {
    ModelParameters params(mu, sigma, rho, grid);
    std::unique_ptr<HJBModel> model;
    {
        ConstantPayoff payoff(2.5);
        model = std::make_unique<HJBModel>(params, payoff);
    }
    EXPECT_EQ(model->payoff().value(0.3, 0.7), 2.5);
}

// ============================================================================
// Terminal value
// ============================================================================

TEST_F(HJBModelTest, ZeroPayoffGivesZeroTerminalValue) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, ConstantPayoff(0.0));

    auto vT = model.terminalValue(1.0);
    ASSERT_EQ(vT.size(), grid.size());
    for (double v : vT) {
        EXPECT_NEAR(v, 0.0, 1e-14);
    }
}

TEST_F(HJBModelTest, TerminalValueWithoutDynamics) {
    // mu = sigma = 0: A = rho*I, v(T) = r(.,T)/rho
    ModelParameters params(0.0, 0.0, rho, grid);
    HJBModel model(params, DecayingLinearPayoff(1.0));

    const double T = 1.0;
    auto vT = model.terminalValue(T);
    for (size_t i = 0; i < grid.size(); ++i) {
        EXPECT_NEAR(vT[i], grid.point(i) * std::exp(-T) / rho, 1e-10);
    }
}

TEST_F(HJBModelTest, TerminalValueIsStationary) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, DecayingLinearPayoff(1.0));

    const double T = 1.0;
    auto vT = model.terminalValue(T);
    auto dvdt = model.rhs(vT, T);

    for (double d : dvdt) {
        EXPECT_NEAR(d, 0.0, 1e-9);
    }
}

TEST_F(HJBModelTest, ConstantPayoffGivesConstantTerminalValue) {
    // reflecting boundaries: constants are in the kernel of L
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, ConstantPayoff(1.0));

    auto vT = model.terminalValue(2.0);
    for (double v : vT) {
        EXPECT_NEAR(v, 1.0 / rho, 1e-8);
    }
}

TEST_F(HJBModelTest, RepeatedTerminalSolvesAgree) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, DecayingLinearPayoff(1.0));

    auto first = model.terminalValue(1.0);
    auto second = model.terminalValue(1.0);
    EXPECT_EQ(first, second);
}

TEST_F(HJBModelTest, SingularSystemThrows) {
    // rho = mu = sigma = 0: rho*I - L is the zero matrix
    ModelParameters params(0.0, 0.0, 0.0, grid);
    HJBModel model(params, ConstantPayoff(1.0));

    EXPECT_THROW(model.terminalValue(1.0), SingularSystemError);
}

TEST_F(HJBModelTest, UndiscountedReflectingSystemIsSingular) {
    // rho = 0: A = -L, constants lie in its kernel under reflecting boundaries
    ModelParameters params(mu, sigma, 0.0, grid);
    HJBModel model(params, DecayingLinearPayoff(1.0));

    for (double s : MatrixOps::rowSums(model.systemMatrix())) {
        EXPECT_NEAR(s, 0.0, 1e-10);
    }
    EXPECT_THROW(model.terminalValue(1.0), SingularSystemError);
}

TEST_F(HJBModelTest, NonFiniteTerminalTimeThrows) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, ConstantPayoff(1.0));

    EXPECT_THROW(model.terminalValue(NAN), std::invalid_argument);
}

// ============================================================================
// Right-hand side
// ============================================================================

TEST_F(HJBModelTest, RhsMatchesFormula) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, DecayingLinearPayoff(1.0));

    std::vector<double> v(grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        v[i] = std::cos(3.0 * grid.point(i));
    }
    const double t = 0.4;

    auto dvdt = model.rhs(v, t);
    auto Av = MatrixOps::multiply(model.systemMatrix(), v);
    ASSERT_EQ(dvdt.size(), grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        EXPECT_NEAR(dvdt[i], Av[i] - grid.point(i) * std::exp(-t), 1e-12);
    }
}

TEST_F(HJBModelTest, RhsOfZeroStateIsMinusPayoff) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, ConstantPayoff(3.0));

    std::vector<double> zero(grid.size(), 0.0);
    std::vector<double> dvdt;
    model(zero, dvdt, 0.0);

    ASSERT_EQ(dvdt.size(), grid.size());
    for (double d : dvdt) {
        EXPECT_EQ(d, -3.0);
    }
}

TEST_F(HJBModelTest, RhsRejectsWrongStateSize) {
    ModelParameters params(mu, sigma, rho, grid);
    HJBModel model(params, ConstantPayoff(1.0));

    std::vector<double> v(grid.size() + 1, 0.0);
    EXPECT_THROW(model.rhs(v, 0.0), std::invalid_argument);
}

// ============================================================================
// Payoffs
// ============================================================================

TEST(PayoffTest, Values) {
    EXPECT_EQ(ConstantPayoff(1.5)(0.2, 0.3), 1.5);
    EXPECT_NEAR(DecayingLinearPayoff(1.0)(0.5, 2.0), 0.5 * std::exp(-2.0), 1e-15);
    EXPECT_NEAR(DecayingLinearPayoff(0.0)(0.5, 2.0), 0.5, 1e-15);

    FunctionPayoff fn([](double x, double t) { return x * x + t; });
    EXPECT_NEAR(fn(0.5, 1.0), 1.25, 1e-15);
}

TEST(PayoffTest, EvaluateOnGrid) {
    Grid grid(0.0, 1.0, 5);
    auto r = DecayingLinearPayoff(1.0).evaluate(grid, 0.0);

    ASSERT_EQ(r.size(), 5u);
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_NEAR(r[i], grid.point(i), 1e-15);
    }
}

TEST(PayoffTest, NullFunctionThrows) {
    EXPECT_THROW(FunctionPayoff(nullptr), std::invalid_argument);
}
