#include "engine/INotifier.h"
#include "common/Logger.h"

namespace triplersi {
namespace engine {

void LogNotifier::signalRejected(const Signal& signal, const std::string& reason) {
    LOG_WARN("[NOTIFY] {} signal rejected (confidence {:.2f}): {}",
             toString(signal.direction), signal.confidence, reason);
}

void LogNotifier::tradeOpened(const Trade& trade) {
    LOG_INFO("[NOTIFY] Trade opened {} {} qty {:.6f} @ {:.4f} (SL {:.4f}, TP {:.4f}){}",
             trade.id, toString(trade.direction), trade.quantity, trade.entry_price,
             trade.stop_loss, trade.take_profit,
             trade.deferred_protection ? " - protection deferred" : "");
}

void LogNotifier::tradeClosed(const Trade& trade) {
    LOG_INFO("[NOTIFY] Trade closed {} {} @ {:.4f} PnL {:+.4f} ({})",
             trade.id, toString(trade.direction), trade.exit_price, trade.pnl,
             toString(trade.exit_reason));
}

void LogNotifier::tradeFailed(const Trade& trade, const std::string& reason) {
    LOG_ERROR("[NOTIFY] Trade failed {}: {}", trade.id, reason);
}

void LogNotifier::fallbackFill(const Trade& trade, double slippage_pct) {
    LOG_WARN("[NOTIFY] Market fallback fill on {} (slippage {:.4f}%)", trade.id, slippage_pct);
}

void LogNotifier::tradeAnomaly(const Trade& trade, const std::string& message) {
    LOG_ERROR("[NOTIFY] Anomaly on {}: {}", trade.id, message);
}

void LogNotifier::emergencyStop(const std::string& reason) {
    LOG_ERROR("[NOTIFY] EMERGENCY STOP: {}", reason);
}

void LogNotifier::reconciliation(const std::string& finding) {
    LOG_WARN("[NOTIFY] Reconciliation: {}", finding);
}

void LogNotifier::connection(const std::string& message) {
    LOG_WARN("[NOTIFY] Connection: {}", message);
}

} // namespace engine
} // namespace triplersi
