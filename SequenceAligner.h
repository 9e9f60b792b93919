#pragma once

#include "PoseTypes.h"

#include <limits>
#include <map>
#include <string>
#include <vector>

struct AlignmentResult {
    AlignmentPath path;
    double totalCost = 0.0;
    double normalizedCost = 0.0;   // totalCost / path length
};

/**
 * @brief Dynamic time warping over angle-vector sequences
 *
 * Pair cost is the tolerance-normalized squared distance over the angles
 * both frames measured. The cumulative grid is filled row by row and
 * predecessors are recomputed during the backtrace, preferring the
 * diagonal, then up (reference advances), then left (candidate advances).
 */
class SequenceAligner {
public:
    struct Options {
        int bandWidth = 0;                      // Sakoe-Chiba radius, 0 = unbounded
        double missingPairPenalty = 1.0e6;      // pair cost when no angle is shared
        double degenerateCostLimit = 5.0e5;     // normalized cost above this fails
    };

    SequenceAligner();
    explicit SequenceAligner(Options options);

    // Throws PoseError(AlignmentInputTooShort | AlignmentDegenerate | InvalidConfiguration)
    AlignmentResult align(const AngleSequence& reference,
                          const AngleSequence& candidate,
                          const std::map<std::string, double>& tolerances) const;

    double pairCost(const AngleVector& reference,
                    const AngleVector& candidate,
                    const std::map<std::string, double>& tolerances) const;

    const Options& getOptions() const noexcept { return options; }

private:
    // Cumulative cost arena; only cells inside the band are stored
    class CostGrid {
    public:
        CostGrid(int rows, int cols, int bandWidth);

        double at(int i, int j) const;
        void set(int i, int j, double value);
        bool inBand(int i, int j) const;
        int firstColumn(int i) const;
        int lastColumn(int i) const;

    private:
        int rows;
        int cols;
        int band;
        int stride;
        std::vector<double> cells;
    };

    Options options;
};
