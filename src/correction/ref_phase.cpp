#include "insar_rate/correction/ref_phase.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/parallel/collectives.hpp"

#include <algorithm>
#include <cmath>

namespace insar_rate::correction {

namespace {

enum class RefPhaseMethod { COMMON_MEDIAN = 1, CHIP_MEDIAN = 2 };

RefPhaseMethod parse_method(int method) {
    if (method == 1) return RefPhaseMethod::COMMON_MEDIAN;
    if (method == 2) return RefPhaseMethod::CHIP_MEDIAN;
    throw ConfigError("Unsupported reference phase method " + std::to_string(method) +
                      " (expected 1 or 2)");
}

void subtract_and_write(ifg::Interferogram& ifg, double ref) {
    ifg.phase_data().array() -= static_cast<float>(ref);
    ifg.metadata().set(ifg::keys::kRefPhase, ifg::kRemoved);
    ifg.write_modified_phase();
}

} // namespace

bool ref_phase_already_removed(const ifg::PrereadRegistry& registry) {
    size_t removed = 0;
    for (const auto& path : registry.paths) {
        const auto& md = registry.at(path).metadata;
        if (md.get_string(ifg::keys::kRefPhase).value_or("") == ifg::kRemoved) {
            ++removed;
        }
    }
    if (removed == 0) {
        return false;
    }
    if (removed == registry.size()) {
        return true;
    }
    throw ReferencePhaseError(std::to_string(removed) + " of " + std::to_string(registry.size()) +
                              " interferograms already have the reference phase removed; "
                              "start again from uncorrected inputs");
}

double est_ref_phase_median(const Matrix2Df& phase, const Matrix2Dd& mask) {
    if (phase.rows() != mask.rows() || phase.cols() != mask.cols()) {
        throw ReferencePhaseError("Mask shape differs from the phase raster");
    }
    std::vector<double> values;
    values.reserve(static_cast<size_t>(phase.size()));
    for (Eigen::Index i = 0; i < phase.size(); ++i) {
        if (mask.data()[i] == 0.0) {
            values.push_back(phase.data()[i]);
        }
    }
    const double ref = core::nan_median(std::move(values));
    if (std::isnan(ref)) {
        throw ReferencePhaseError("No pixel is valid in every interferogram");
    }
    return ref;
}

double est_ref_phase_chip(const Matrix2Df& phase, const PixelCoord& ref, int chip_size,
                          double min_frac) {
    const int half = chip_size / 2;
    const int side = 2 * half + 1;
    const double thresh = min_frac * side * side;

    const int r0 = std::max(0, ref.y - half);
    const int c0 = std::max(0, ref.x - half);
    const int r1 = std::min(static_cast<int>(phase.rows()), ref.y + half + 1);
    const int c1 = std::min(static_cast<int>(phase.cols()), ref.x + half + 1);
    if (r1 <= r0 || c1 <= c0) {
        throw ReferencePhaseError("Reference pixel (" + std::to_string(ref.x) + ", " +
                                  std::to_string(ref.y) + ") is outside the raster");
    }

    const Matrix2Df chip = phase.block(r0, c0, r1 - r0, c1 - c0);
    if (static_cast<double>(core::count_finite(chip)) < thresh) {
        throw ReferencePhaseError("Too few valid samples around the reference pixel (" +
                                  std::to_string(core::count_finite(chip)) + " < " +
                                  core::format_double(thresh) + ")");
    }
    return core::nan_median(std::vector<double>(chip.data(), chip.data() + chip.size()));
}

Matrix2Dd local_phase_sum(const std::vector<std::string>& paths, const config::Config& cfg,
                          int rows, int cols) {
    Matrix2Dd sum = Matrix2Dd::Zero(rows, cols);
    for (const auto& path : paths) {
        ifg::Interferogram ifg(path);
        ifg.open(true);
        ifg::nan_and_mm_convert(ifg, cfg);
        if (ifg.nrows() != rows || ifg.ncols() != cols) {
            throw ReferencePhaseError("Unexpected raster shape: " + path);
        }
        sum += ifg.phase_data().cast<double>();
        ifg.close();
    }
    return sum;
}

Matrix2Dd common_nan_mask(parallel::ExecutionContext& ctx, const Matrix2Dd& local_sum) {
    Matrix2Dd mask;
    if (!ctx.is_leader()) {
        ctx.send(parallel::kLeader, ctx.rank(), parallel::encode(local_sum));
    } else {
        Matrix2Dd total = local_sum;
        for (int source = 1; source < ctx.size(); ++source) {
            const Matrix2Dd part = parallel::decode<Matrix2Dd>(ctx.recv(source, source));
            if (part.rows() != total.rows() || part.cols() != total.cols()) {
                throw ParallelError("Rank " + std::to_string(source) +
                                    " sent a phase sum of a different shape");
            }
            total += part;
        }
        mask = total.unaryExpr([](double v) { return std::isnan(v) ? 1.0 : 0.0; });
    }
    return parallel::broadcast_value(ctx, mask);
}

std::vector<double> ref_phase_estimation(parallel::ExecutionContext& ctx,
                                         const ifg::PrereadRegistry& registry,
                                         const PixelCoord& ref_pixel, const config::Config& cfg) {
    if (ref_phase_already_removed(registry)) {
        return {};
    }
    const RefPhaseMethod method = parse_method(cfg.refphase.method);

    const std::vector<std::string> shard = parallel::split(registry.paths, ctx);
    const auto& first = registry.at(registry.paths.front());

    Matrix2Dd mask;
    if (method == RefPhaseMethod::COMMON_MEDIAN) {
        mask = common_nan_mask(ctx, local_phase_sum(shard, cfg, first.nrows, first.ncols));
    }

    std::vector<double> local;
    local.reserve(shard.size());
    for (const auto& path : shard) {
        ifg::Interferogram ifg(path);
        ifg.open(false);
        ifg::nan_and_mm_convert(ifg, cfg);

        const double ref = method == RefPhaseMethod::COMMON_MEDIAN
                               ? est_ref_phase_median(ifg.phase_data(), mask)
                               : est_ref_phase_chip(ifg.phase_data(), ref_pixel,
                                                    cfg.refphase.chip_size, cfg.refphase.min_frac);
        subtract_and_write(ifg, ref);
        ifg.close();
        local.push_back(ref);
    }

    std::vector<double> ref_phs = parallel::gather_ordered_by_rank(ctx, local, registry.size());
    if (ctx.is_leader()) {
        Matrix2Dd row(1, static_cast<Eigen::Index>(ref_phs.size()));
        for (size_t i = 0; i < ref_phs.size(); ++i) {
            row(0, static_cast<Eigen::Index>(i)) = ref_phs[i];
        }
        io::write_fits_double(fs::path(cfg.output.tmpdir) / kRefPhaseFile, row);
    }
    return ref_phs;
}

} // namespace insar_rate::correction
