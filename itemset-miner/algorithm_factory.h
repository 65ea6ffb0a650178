#pragma once

#include <memory>
#include <string>
#include "mining_algorithm.h"
#include "errors.h"
#include "apriori/apriori_miner.h"
#include "eclat/eclat_miner.h"
#include "fpgrowth/fpgrowth_miner.h"
#include "projection/projection_miner.h"
#include "sam/sam_miner.h"
#include "ista/ista_miner.h"

enum class AlgorithmKind {
    Apriori,
    Eclat,
    FPGrowth,
    Projection,
    Sam,
    Ista,
};

inline AlgorithmKind parse_algorithm_kind(const std::string& name) {
    if (name == "apriori")
        return AlgorithmKind::Apriori;
    if (name == "eclat")
        return AlgorithmKind::Eclat;
    if (name == "fpgrowth" || name == "fpg" || name == "default")
        return AlgorithmKind::FPGrowth;
    if (name == "proj" || name == "projection")
        return AlgorithmKind::Projection;
    if (name == "sam")
        return AlgorithmKind::Sam;
    if (name == "ista")
        return AlgorithmKind::Ista;

    throw InvalidConfigError("Unknown algorithm name: " + name);
}

inline std::unique_ptr<IMiningAlgorithm> make_algorithm(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::Apriori:
            return std::make_unique<AprioriMiner>();
        case AlgorithmKind::Eclat:
            return std::make_unique<EclatMiner>();
        case AlgorithmKind::FPGrowth:
            return std::make_unique<FPGrowthMiner>();
        case AlgorithmKind::Projection:
            return std::make_unique<ProjectionMiner>();
        case AlgorithmKind::Sam:
            return std::make_unique<SamMiner>();
        case AlgorithmKind::Ista:
            return std::make_unique<IstaMiner>();
    }
    throw InvalidConfigError("Unsupported algorithm kind");
}
