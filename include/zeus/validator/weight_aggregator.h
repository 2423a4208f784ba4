// ZEUS - Consensus Weight Aggregation
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Folds each epoch's scores into per-miner consensus weights and produces
// the normalized weight vector for export.

#ifndef ZEUS_VALIDATOR_WEIGHT_AGGREGATOR_H
#define ZEUS_VALIDATOR_WEIGHT_AGGREGATOR_H

#include "zeus/validator/miner_record.h"
#include "zeus/validator/params.h"

#include <map>
#include <string>
#include <vector>

namespace zeus {

namespace util {
class JSONValue;
}

namespace validator {

/// Normalized weights of one epoch
struct WeightVector {
    uint64_t epoch{0};
    std::map<MinerId, double> weights;
    
    double Total() const;
    double WeightOf(const MinerId& id) const;
    
    /// {"epoch": n, "weights": {"miner": w, ...}}
    util::JSONValue ToJSON() const;
    
    /// Write ToJSON() to path (via a temporary file and rename)
    bool WriteFile(const std::string& path, std::string& error) const;
};

/**
 * Single-writer aggregation pass.
 *
 * For each record the mean score of the epoch is folded into the record's
 * weight tracker. The fast tracker is used while fast and slow agree within
 * consensusWeightThreshold, otherwise the slow one. Early-detected miners
 * get (1 + bondAggressiveness) times their raw weight. Weights are then
 * scaled to sum to weightTotal, or split evenly if every raw weight is 0.
 *
 * The caller must guarantee that nothing else mutates the records for the
 * duration of Aggregate().
 */
class WeightAggregator {
public:
    explicit WeightAggregator(const ValidatorConfig& config) : config_(config) {}
    
    /// Raw (unnormalized) weight after folding this epoch's scores
    double FoldEpoch(MinerRecord& record) const;
    
    /// Run the pass over all records and write back consensusWeight
    WeightVector Aggregate(std::vector<MinerRecord*>& records, uint64_t epoch) const;

private:
    ValidatorConfig config_;
};

} // namespace validator
} // namespace zeus

#endif // ZEUS_VALIDATOR_WEIGHT_AGGREGATOR_H
