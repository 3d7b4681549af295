#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/parallel/context.hpp"

#include <memory>
#include <string>
#include <vector>

namespace insar_rate::correction {

enum class OrbitalDegree { PLANAR, QUADRATIC };

OrbitalDegree parse_orbital_degree(const std::string& degree);

// Number of surface coefficients, not counting the constant offset
int orbital_num_params(OrbitalDegree degree);

// Block average ignoring NaN; a block without valid samples is NaN
Matrix2Df multilook(const Matrix2Df& phase, int looks);

// Surface terms at full-resolution pixel (x, y): planar x, y; quadratic
// x^2, y^2, xy, x, y
void surface_terms(double x, double y, OrbitalDegree degree, double* out);

// Least-squares fit of surface plus constant to the finite cells of the
// multilooked phase. Returns the surface coefficients followed by the offset.
VectorXd fit_orbital_surface(const Matrix2Df& phase, OrbitalDegree degree, int looks);

// Full-resolution surface (without the constant) for the given coefficients
Matrix2Df evaluate_surface(const VectorXd& coeffs, int rows, int cols, OrbitalDegree degree);

// Removes orbital error from every interferogram of a stack.
class OrbitalExecutor {
public:
    virtual ~OrbitalExecutor() = default;

    // Corrects interferograms on disk. Other ranks may still be writing on
    // return; synchronise before reading the stack.
    virtual void run(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                     const config::Config& cfg) = 0;
};

// Independent per-interferogram fits, spread over all ranks
class DistributedOrbitalExecutor : public OrbitalExecutor {
public:
    void run(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
             const config::Config& cfg) override;
};

// Joint network fit of per-epoch surfaces, computed by the leader alone
class LeaderOrbitalExecutor : public OrbitalExecutor {
public:
    void run(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
             const config::Config& cfg) override;
};

// "independent" or "network"; anything else raises ConfigError
std::unique_ptr<OrbitalExecutor> make_orbital_executor(const std::string& method);

// Per-interferogram correction used by DistributedOrbitalExecutor
void remove_orbital_error(const fs::path& path, const config::Config& cfg);

// Network fit over the given interferograms, corrected and rewritten in place
void network_orbital_correction(const std::vector<fs::path>& paths, const config::Config& cfg);

} // namespace insar_rate::correction
