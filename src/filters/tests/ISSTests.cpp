#include <cmath>
#include <iostream>
#include <stdexcept>

#include "filters/ISS.h"

using haptic_toolbox::filters::ISS;
using Vec3 = haptic_toolbox::math::Vector<double, 3>;

namespace
{
    bool near(const Vec3& a, const Vec3& b, double tol = 1e-9)
    {
        return (a - b).norm() <= tol;
    }

    template <typename Fn>
    bool throwsInvalidArgument(Fn fn)
    {
        try
        {
            fn();
        }
        catch (const std::invalid_argument&)
        {
            return true;
        }
        return false;
    }
}

int main()
{
    // Construction rejects mu_max <= 0 and tau < 0
    if (!throwsInvalidArgument([] { ISS<double, 3> iss(0.01, 0.0); }) ||
        !throwsInvalidArgument([] { ISS<double, 3> iss(0.01, -1.0); }) ||
        !throwsInvalidArgument([] { ISS<double, 3> iss(-0.01, 1.0); }))
    {
        std::cerr << "Invalid ISS parameters accepted\n";
        return 1;
    }

    const double tau = 0.005;
    const double muMax = 10.0;
    const double dt = 0.001;
    ISS<double, 3> iss(tau, muMax);

    if (iss.prevForce() != Vec3::Zero())
    {
        std::cerr << "prev force not zero after construction\n";
        return 1;
    }

    // First tick: derivative against the zero vector
    const Vec3 force{1.0, -2.0, 0.5};
    const Vec3 expectedFirst = force + force * tau / dt;
    if (!near(iss.calculateForce(force, dt), expectedFirst))
    {
        std::cerr << "First ISS force mismatch\n";
        return 1;
    }

    // Constant input across two ticks: derivative term vanishes
    if (iss.calculateForce(force, dt) != force)
    {
        std::cerr << "ISS force differs from a constant input\n";
        return 1;
    }

    // Velocity shaping is a pure read of the stored force
    const Vec3 vel{0.2, 0.1, -0.3};
    const Vec3 nextForce{1.5, -2.0, 0.0};
    const Vec3 expectedVel = vel - (nextForce - force) / dt / muMax;
    const Vec3 shaped = iss.calculateVel(vel, nextForce, dt);
    if (!near(shaped, expectedVel) || !near(iss.calculateVel(vel, nextForce, dt), shaped) ||
        iss.prevForce() != force)
    {
        std::cerr << "ISS velocity mismatch or state mutated\n";
        return 1;
    }
    if (iss.calculateVel(vel, force, dt) != vel)
    {
        std::cerr << "ISS velocity must pass through when force is unchanged\n";
        return 1;
    }

    // Setters reject out-of-domain values and keep the old ones
    if (iss.setTau(-1.0) || iss.tau() != tau)
    {
        std::cerr << "Negative tau accepted\n";
        return 1;
    }
    if (iss.setMuMax(0.0) || iss.setMuMax(-3.0) || iss.muMax() != muMax)
    {
        std::cerr << "Non-positive mu_max accepted\n";
        return 1;
    }
    if (!iss.setTau(0.0) || iss.tau() != 0.0 || !iss.setMuMax(20.0) || iss.muMax() != 20.0)
    {
        std::cerr << "Valid ISS setter rejected\n";
        return 1;
    }

    // tau == 0 passes the force through
    if (iss.calculateForce(nextForce, dt) != nextForce)
    {
        std::cerr << "tau = 0 must not alter the force\n";
        return 1;
    }

    // dt == 0 is not guarded: the result is non-finite, never silently zero
    ISS<double, 3> unguarded(tau, muMax);
    if (unguarded.calculateForce(force, 0.0).allFinite())
    {
        std::cerr << "dt = 0 produced a finite force\n";
        return 1;
    }

    // Single precision instance
    ISS<float, 1> issf(0.5f, 1.0f);
    const haptic_toolbox::math::Vector<float, 1> ff{2.0f};
    if (std::fabs(issf.calculateForce(ff, 1.0f)[0] - 3.0f) > 1e-6f)
    {
        std::cerr << "float ISS mismatch\n";
        return 1;
    }

    return 0;
}
