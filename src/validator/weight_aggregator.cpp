// ZEUS - Consensus Weight Aggregation Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/validator/weight_aggregator.h"
#include "zeus/validator/scoring_engine.h"
#include "zeus/util/json.h"
#include "zeus/util/logging.h"

#include <algorithm>
#include <cstdio>
#include <fstream>

namespace zeus {
namespace validator {

// ============================================================================
// WeightVector
// ============================================================================

double WeightVector::Total() const {
    double sum = 0.0;
    for (const auto& [id, w] : weights) {
        sum += w;
    }
    return sum;
}

double WeightVector::WeightOf(const MinerId& id) const {
    auto it = weights.find(id);
    return it == weights.end() ? 0.0 : it->second;
}

util::JSONValue WeightVector::ToJSON() const {
    util::JSONValue obj;
    obj["epoch"] = epoch;
    util::JSONValue byMiner{util::JSONValue::Object{}};
    for (const auto& [id, w] : weights) {
        byMiner[id] = w;
    }
    obj["weights"] = std::move(byMiner);
    return obj;
}

bool WeightVector::WriteFile(const std::string& path, std::string& error) const {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            error = "cannot open " + tmp;
            return false;
        }
        out << ToJSON().ToJSON(true) << "\n";
        if (!out.good()) {
            error = "write failed for " + tmp;
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        error = "rename to " + path + " failed";
        return false;
    }
    return true;
}

// ============================================================================
// WeightAggregator
// ============================================================================

double WeightAggregator::FoldEpoch(MinerRecord& record) const {
    if (record.epochScoreCount > 0) {
        double mean = record.epochScoreSum / record.epochScoreCount;
        record.weightTracker.Update(mean, config_.alphaHigh, config_.alphaLow);
    }
    record.epochScoreSum = 0.0;
    record.epochScoreCount = 0;
    
    const DualRateEwma& t = record.weightTracker;
    double raw = t.Agreement() >= config_.consensusWeightThreshold ? t.Fast() : t.Slow();
    
    if (QualifiesForEarlyDetection(record, config_)) {
        raw *= 1.0 + config_.bondAggressiveness;
        LOG_DEBUG(util::LogCategory::WEIGHTS) << "Early-detection boost for " << record.minerId;
    }
    return std::max(raw, 0.0);
}

WeightVector WeightAggregator::Aggregate(std::vector<MinerRecord*>& records,
                                         uint64_t epoch) const {
    WeightVector result;
    result.epoch = epoch;
    if (records.empty()) {
        return result;
    }
    
    std::vector<double> raw;
    raw.reserve(records.size());
    double sum = 0.0;
    for (MinerRecord* r : records) {
        raw.push_back(FoldEpoch(*r));
        sum += raw.back();
    }
    
    for (size_t i = 0; i < records.size(); ++i) {
        double w = sum > 0.0
            ? raw[i] / sum * config_.weightTotal
            : config_.weightTotal / static_cast<double>(records.size());
        records[i]->consensusWeight = w;
        result.weights[records[i]->minerId] = w;
    }
    
    LOG_INFO(util::LogCategory::WEIGHTS) << "Epoch " << epoch << ": aggregated weights for "
                                         << records.size() << " miners";
    return result;
}

} // namespace validator
} // namespace zeus
