#pragma once

#include <string>

#include "common/Types.h"

namespace triplersi {
namespace engine {

// 운영자 알림 채널 (채팅/메일 발송기는 외부 구현)
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual void signalRejected(const Signal& signal, const std::string& reason) = 0;
    virtual void tradeOpened(const Trade& trade) = 0;
    virtual void tradeClosed(const Trade& trade) = 0;
    virtual void tradeFailed(const Trade& trade, const std::string& reason) = 0;
    virtual void fallbackFill(const Trade& trade, double slippage_pct) = 0;
    virtual void tradeAnomaly(const Trade& trade, const std::string& message) = 0;
    virtual void emergencyStop(const std::string& reason) = 0;
    virtual void reconciliation(const std::string& finding) = 0;
    virtual void connection(const std::string& message) = 0;
};

// 기본 구현: 로그로만 남김
class LogNotifier : public INotifier {
public:
    void signalRejected(const Signal& signal, const std::string& reason) override;
    void tradeOpened(const Trade& trade) override;
    void tradeClosed(const Trade& trade) override;
    void tradeFailed(const Trade& trade, const std::string& reason) override;
    void fallbackFill(const Trade& trade, double slippage_pct) override;
    void tradeAnomaly(const Trade& trade, const std::string& message) override;
    void emergencyStop(const std::string& reason) override;
    void reconciliation(const std::string& finding) override;
    void connection(const std::string& message) override;
};

} // namespace engine
} // namespace triplersi
