/**
 * Trend prediction string helpers
 */

#include "trend_engine/prediction/trend_prediction.h"

namespace trend_engine {
namespace prediction {

std::string directionToString(Direction direction) {
    switch (direction) {
        case Direction::BULLISH: return "BULLISH";
        case Direction::BEARISH: return "BEARISH";
        case Direction::SIDEWAYS: return "SIDEWAYS";
    }
    return "SIDEWAYS";
}

std::string strengthToString(Strength strength) {
    switch (strength) {
        case Strength::WEAK: return "WEAK";
        case Strength::MODERATE: return "MODERATE";
        case Strength::STRONG: return "STRONG";
    }
    return "WEAK";
}

std::string factorImpactToString(FactorImpact impact) {
    switch (impact) {
        case FactorImpact::POSITIVE: return "POSITIVE";
        case FactorImpact::NEGATIVE: return "NEGATIVE";
        case FactorImpact::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string predictionStageToString(PredictionStage stage) {
    switch (stage) {
        case PredictionStage::COLLECTING: return "COLLECTING";
        case PredictionStage::SCORING: return "SCORING";
        case PredictionStage::PREDICTING: return "PREDICTING";
        case PredictionStage::CACHING: return "CACHING";
        case PredictionStage::DONE: return "DONE";
        case PredictionStage::ERROR: return "ERROR";
    }
    return "ERROR";
}

} // namespace prediction
} // namespace trend_engine
