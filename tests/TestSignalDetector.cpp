#include "strategy/SignalDetector.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using namespace triplersi;
using strategy::SignalDetector;

namespace {

class RecordingSink : public strategy::ISignalSink {
public:
    void onSignal(const Signal& signal) override { signals.push_back(signal); }
    std::vector<Signal> signals;
};

Timestamp g_clock = 1000000;

IndicatorSnapshot snapshot(double rsi, bool ha_green) {
    IndicatorSnapshot s;
    s.rsi = {rsi, rsi, rsi};
    s.ha_open = 100.0;
    s.ha_close = ha_green ? 101.0 : 99.0;
    s.close = 100.0;
    g_clock += 300000;
    s.candle_close_time = g_clock;
    return s;
}

} // namespace

int main() {
    // 과매도 무장 → 다음 캔들 HA 양봉에서 확정 (RSI 는 이미 회복)
    {
        RecordingSink sink;
        engine::SignalConfig cfg;
        SignalDetector detector(cfg, &sink);

        assert(!detector.update(snapshot(25.0, false)));
        auto st = detector.status();
        assert(st.pending_long && !st.pending_short);
        const Timestamp armed_at = st.long_armed_at;

        auto signal = detector.update(snapshot(45.0, true));
        assert(signal);
        assert(signal->direction == Direction::LONG);
        assert(signal->detected_at == armed_at);
        assert(signal->confirmed_at > armed_at);
        assert(std::fabs(signal->confidence - 1.0) < 1e-9);
        assert(sink.signals.size() == 1);

        st = detector.status();
        assert(!st.pending_long && !st.pending_short);
        assert(st.signals_detected == 1);
    }

    // RSI 일부만 조건 충족 → 무장 안 함
    {
        engine::SignalConfig cfg;
        SignalDetector detector(cfg);
        IndicatorSnapshot s = snapshot(25.0, false);
        s.rsi[2] = 35.0;
        detector.update(s);
        assert(!detector.status().pending_long);
    }

    // 반대 방향 무장 시 기존 대기 해제 (동시에 둘 다 대기 불가)
    {
        engine::SignalConfig cfg;
        SignalDetector detector(cfg);
        detector.update(snapshot(20.0, false));
        assert(detector.status().pending_long);

        auto signal = detector.update(snapshot(80.0, true));
        assert(!signal);
        auto st = detector.status();
        assert(!st.pending_long && st.pending_short);
        assert(st.latches_dropped == 1);

        signal = detector.update(snapshot(60.0, false));
        assert(signal);
        assert(signal->direction == Direction::SHORT);
    }

    // NaN 입력 → 상태 변화 없음
    {
        engine::SignalConfig cfg;
        SignalDetector detector(cfg);
        detector.update(snapshot(25.0, false));

        IndicatorSnapshot bad = snapshot(std::numeric_limits<double>::quiet_NaN(), false);
        assert(!detector.update(bad));
        assert(detector.status().pending_long);
        assert(!SignalDetector::rsiCondition(bad, Direction::LONG, cfg));
        assert(!SignalDetector::rsiCondition(IndicatorSnapshot(), Direction::SHORT, cfg));
    }

    // LATCHED: RSI 가 중립으로 돌아가도 대기 유지
    {
        engine::SignalConfig cfg;
        SignalDetector detector(cfg);
        detector.update(snapshot(25.0, false));
        detector.update(snapshot(50.0, false));
        detector.update(snapshot(55.0, false));
        assert(detector.status().pending_long);
    }

    // 대기 중 추가 과매도 캔들 → 최초 latch 시각 유지
    {
        engine::SignalConfig cfg;
        SignalDetector detector(cfg);
        detector.update(snapshot(25.0, false));
        const Timestamp first_armed = detector.status().long_armed_at;
        assert(first_armed > 0);

        detector.update(snapshot(22.0, false));
        detector.update(snapshot(20.0, false));
        auto st = detector.status();
        assert(st.long_armed_at == first_armed);
        assert(st.latches_armed == 1);

        auto signal = detector.update(snapshot(40.0, true));
        assert(signal);
        assert(signal->detected_at == first_armed);
    }

    // RECONFIRM: 조건이 깨지면 해제, 확정은 조건 유지 중에만
    {
        engine::SignalConfig cfg;
        cfg.latch_policy = engine::SignalLatchPolicy::RECONFIRM;
        SignalDetector detector(cfg);

        detector.update(snapshot(25.0, false));
        assert(detector.status().pending_long);

        assert(!detector.update(snapshot(45.0, true)));
        auto st = detector.status();
        assert(!st.pending_long);
        assert(st.latches_dropped == 1);

        detector.update(snapshot(25.0, false));
        auto signal = detector.update(snapshot(28.0, true));
        assert(signal);
        assert(signal->direction == Direction::LONG);
    }

    // 필터 없음 → 기본 신뢰도 0.4, 무장 캔들에서 바로 확정
    {
        engine::SignalConfig cfg;
        cfg.filter_ha = false;
        SignalDetector detector(cfg);
        auto signal = detector.update(snapshot(25.0, false));
        assert(signal);
        assert(std::fabs(signal->confidence - 0.4) < 1e-9);
    }

    // 추세 필터
    {
        IndicatorSnapshot s = snapshot(25.0, true);
        s.close = 105.0;
        s.ema = 100.0;
        s.ema_slope = 0.5;
        assert(SignalDetector::trendFilter(s, Direction::LONG));
        assert(!SignalDetector::trendFilter(s, Direction::SHORT));
        s.rsi_mtf = 40.0;
        assert(SignalDetector::mtfRsiFilter(s, Direction::SHORT));
        assert(!SignalDetector::mtfRsiFilter(s, Direction::LONG));
    }

    // reset
    {
        engine::SignalConfig cfg;
        SignalDetector detector(cfg);
        detector.update(snapshot(80.0, false));
        assert(detector.status().pending_short);
        detector.reset();
        assert(!detector.status().pending_short);
    }

    std::cout << "[TEST] SignalDetector PASSED\n";
    return 0;
}
