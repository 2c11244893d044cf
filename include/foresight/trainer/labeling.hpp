#pragma once

#include "foresight/config.hpp"
#include "foresight/types.hpp"

namespace foresight {

/**
 * @brief Training label for the action classifier, from a realized return
 *
 *   return >=  strong            STRONG_BUY  (BUY when confidence is below strong_min_confidence)
 *   return >=  buy               BUY
 *   return <= -strong            STRONG_SELL (SELL when confidence is below strong_min_confidence)
 *   return <= -buy               SELL
 *   otherwise                    HOLD
 *
 * Only used when building training and holdout sets, never at prediction time.
 */
TradeAction label_action(double return_pct, double confidence, const LabelingConfig& labeling);

// 1 when the price went up, 0 otherwise
int label_direction(double return_pct);

}  // namespace foresight
