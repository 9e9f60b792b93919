#include "SequenceAligner.h"
#include "PoseError.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace {
constexpr double kInfinity = std::numeric_limits<double>::infinity();
}

SequenceAligner::CostGrid::CostGrid(int rows, int cols, int bandWidth)
    : rows(rows), cols(cols) {
    band = bandWidth > 0 ? bandWidth : std::max(rows, cols);
    stride = std::min(cols, 2 * band + 1);
    cells.assign(static_cast<size_t>(rows) * stride, kInfinity);
}

bool SequenceAligner::CostGrid::inBand(int i, int j) const {
    return i >= 0 && j >= 0 && i < rows && j < cols && std::abs(i - j) <= band;
}

int SequenceAligner::CostGrid::firstColumn(int i) const {
    return std::max(0, i - band);
}

int SequenceAligner::CostGrid::lastColumn(int i) const {
    return std::min(cols - 1, i + band);
}

double SequenceAligner::CostGrid::at(int i, int j) const {
    if (!inBand(i, j)) {
        return kInfinity;
    }
    return cells[static_cast<size_t>(i) * stride + (j - firstColumn(i))];
}

void SequenceAligner::CostGrid::set(int i, int j, double value) {
    cells[static_cast<size_t>(i) * stride + (j - firstColumn(i))] = value;
}

SequenceAligner::SequenceAligner()
    : SequenceAligner(Options{}) {
}

SequenceAligner::SequenceAligner(Options opts)
    : options(opts) {
    if (options.bandWidth < 0) {
        throw PoseError(ErrorCode::InvalidConfiguration, "dtw_band_width must not be negative");
    }
    if (!(options.missingPairPenalty > 0.0) || !(options.degenerateCostLimit > 0.0)) {
        throw PoseError(ErrorCode::InvalidConfiguration,
                        "missing_pair_penalty and degenerate_cost_limit must be positive");
    }
}

double SequenceAligner::pairCost(const AngleVector& reference,
                                 const AngleVector& candidate,
                                 const std::map<std::string, double>& tolerances) const {
    double cost = 0.0;
    int shared = 0;

    for (const auto& [name, refValue] : reference.values) {
        if (!refValue) {
            continue;
        }
        auto candValue = candidate.get(name);
        auto tolerance = tolerances.find(name);
        if (!candValue || tolerance == tolerances.end()) {
            continue;
        }

        double normalized = (*refValue - *candValue) / tolerance->second;
        cost += normalized * normalized;
        shared++;
    }

    return shared > 0 ? cost : options.missingPairPenalty;
}

AlignmentResult SequenceAligner::align(const AngleSequence& reference,
                                       const AngleSequence& candidate,
                                       const std::map<std::string, double>& tolerances) const {
    const int n = static_cast<int>(reference.size());
    const int m = static_cast<int>(candidate.size());

    if (n == 0 || m == 0) {
        throw PoseError(ErrorCode::AlignmentInputTooShort,
                        "Cannot align empty sequences (reference " + std::to_string(n) +
                        " frames, candidate " + std::to_string(m) + " frames)");
    }
    if (options.bandWidth > 0 && options.bandWidth < std::abs(n - m)) {
        throw PoseError(ErrorCode::InvalidConfiguration,
                        "Band width " + std::to_string(options.bandWidth) +
                        " is smaller than the length difference " + std::to_string(std::abs(n - m)));
    }

    CostGrid grid(n + 1, m + 1, options.bandWidth);
    grid.set(0, 0, 0.0);

    for (int i = 1; i <= n; i++) {
        for (int j = std::max(1, grid.firstColumn(i)); j <= grid.lastColumn(i); j++) {
            double best = std::min({grid.at(i - 1, j - 1), grid.at(i - 1, j), grid.at(i, j - 1)});
            grid.set(i, j, pairCost(reference[i - 1], candidate[j - 1], tolerances) + best);
        }
    }

    // Backtrace from (n, m); grid cell (i, j) is frame pair (i-1, j-1)
    AlignmentResult result;
    result.totalCost = grid.at(n, m);

    int i = n;
    int j = m;
    result.path.emplace_back(i - 1, j - 1);
    while (i > 1 || j > 1) {
        double diagonal = grid.at(i - 1, j - 1);
        double up = grid.at(i - 1, j);
        double left = grid.at(i, j - 1);

        if (diagonal <= up && diagonal <= left) {
            i--;
            j--;
        } else if (up <= left) {
            i--;
        } else {
            j--;
        }
        result.path.emplace_back(i - 1, j - 1);
    }
    std::ranges::reverse(result.path);

    result.normalizedCost = result.totalCost / static_cast<double>(result.path.size());

    spdlog::debug("DTW aligned {}x{} frames: path length {}, cost {:.3f}, normalized {:.3f}",
                  n, m, result.path.size(), result.totalCost, result.normalizedCost);

    if (result.normalizedCost > options.degenerateCostLimit) {
        std::ostringstream msg;
        msg << "Sequences are not comparable: normalized alignment cost " << result.normalizedCost
            << " exceeds " << options.degenerateCostLimit;
        throw PoseError(ErrorCode::AlignmentDegenerate, msg.str());
    }

    return result;
}
