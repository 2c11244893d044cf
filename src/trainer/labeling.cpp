#include "foresight/trainer/labeling.hpp"

namespace foresight {

TradeAction label_action(double return_pct, double confidence, const LabelingConfig& labeling)
{
    const bool strong_eligible = confidence >= labeling.strong_min_confidence;

    if (return_pct >= labeling.strong_threshold_pct) {
        return strong_eligible ? TradeAction::STRONG_BUY : TradeAction::BUY;
    }
    if (return_pct >= labeling.buy_threshold_pct) {
        return TradeAction::BUY;
    }
    if (return_pct <= -labeling.strong_threshold_pct) {
        return strong_eligible ? TradeAction::STRONG_SELL : TradeAction::SELL;
    }
    if (return_pct <= -labeling.buy_threshold_pct) {
        return TradeAction::SELL;
    }
    return TradeAction::HOLD;
}

int label_direction(double return_pct)
{
    return return_pct > 0.0 ? 1 : 0;
}

}  // namespace foresight
