#include "core/shared/exploration_config.h"

#include <cmath>

namespace fr {

namespace {

bool validIterations(int v) { return v >= 1; }
bool validGateLength(int v) { return v >= 1; }
bool validCandidateCap(int v) { return v >= 1; }
bool validMinScore(double v) { return std::isfinite(v) && v >= 0.0; }
bool validRefineTerms(int v) { return v >= 0; }
bool validDecay(double v) { return v > 0.0 && v <= 1.0; }
bool validQualityFloor(double v) { return std::isfinite(v) && v >= 0.0; }

} // namespace

bool ExplorationConfig::isValid() const
{
    return validIterations(iterations)
           && validGateLength(candidateGateMinTokenLen)
           && validCandidateCap(maxCandidatesPerIter)
           && validMinScore(minScore)
           && validRefineTerms(refineTerms)
           && validDecay(iterationDecay)
           && validQualityFloor(qualityFloor);
}

ExplorationConfig ExplorationConfig::sanitized() const
{
    const ExplorationConfig defaults;
    ExplorationConfig out = *this;
    if (!validIterations(out.iterations)) {
        out.iterations = defaults.iterations;
    }
    if (!validGateLength(out.candidateGateMinTokenLen)) {
        out.candidateGateMinTokenLen = defaults.candidateGateMinTokenLen;
    }
    if (!validCandidateCap(out.maxCandidatesPerIter)) {
        out.maxCandidatesPerIter = defaults.maxCandidatesPerIter;
    }
    if (!validMinScore(out.minScore)) {
        out.minScore = defaults.minScore;
    }
    if (!validRefineTerms(out.refineTerms)) {
        out.refineTerms = defaults.refineTerms;
    }
    if (!validDecay(out.iterationDecay)) {
        out.iterationDecay = defaults.iterationDecay;
    }
    if (!validQualityFloor(out.qualityFloor)) {
        out.qualityFloor = defaults.qualityFloor;
    }
    return out;
}

} // namespace fr
